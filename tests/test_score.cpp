// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_score.cpp
 *
 * Tests for optional-valued scores and their combination rules.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "geomancy/score.hpp"

using namespace geomancy;

// ─── Gaussian ───────────────────────────────────────────────────────────────

TEST(GaussianScoreTest, ExactlyOneAtTarget) {
  EXPECT_EQ(gaussianScore(3.0, 3.0, 0.5), 1.0);
  EXPECT_EQ(gaussianScore(-0.1, GaussianTarget{-0.1, 0.3}), 1.0);
}

TEST(GaussianScoreTest, OneSigmaAway) {
  EXPECT_NEAR(gaussianScore(1.0, 0.0, 1.0), std::exp(-1.0), 1e-12);
  EXPECT_NEAR(gaussianScore(-2.0, 0.0, 2.0), std::exp(-1.0), 1e-12);
}

TEST(GaussianScoreTest, DecreasesWithDistance) {
  const GaussianTarget t{10.0, 5.0};
  double prev = gaussianScore(10.0, t);
  for (double v = 11.0; v < 30.0; v += 1.0) {
    const double s = gaussianScore(v, t);
    EXPECT_LT(s, prev);
    EXPECT_GE(s, 0.0);
    prev = s;
  }
}

TEST(GaussianScoreTest, ZeroSigmaIsFloored) {
  const double s = gaussianScore(1.0, 0.0, 0.0);
  EXPECT_TRUE(std::isfinite(s));
  EXPECT_EQ(s, 0.0);
  EXPECT_EQ(gaussianScore(0.0, 0.0, 0.0), 1.0);
}

TEST(GaussianScoreTest, AbsentPropagates) {
  EXPECT_FALSE(gaussianScore(Score(), GaussianTarget{0.0, 1.0}).has_value());
  EXPECT_TRUE(gaussianScore(Score(0.5), GaussianTarget{0.0, 1.0}).has_value());
}

// ─── Combination ────────────────────────────────────────────────────────────

TEST(CombineTest, MeanOfPresentSkipsAbsent) {
  auto m = meanOfPresent({Score(0.2), Score(), Score(0.6)});
  ASSERT_TRUE(m);
  EXPECT_NEAR(*m, 0.4, 1e-12);
  EXPECT_FALSE(meanOfPresent({Score(), Score()}));
  EXPECT_FALSE(meanOfPresent(std::vector<Score>{}));
}

TEST(CombineTest, WeightedMeanRenormalises) {
  auto w = weightedMean({{0.5, Score(1.0)}, {0.25, Score()}, {0.25, Score(0.0)}});
  ASSERT_TRUE(w);
  EXPECT_NEAR(*w, 0.5 / 0.75, 1e-12);
}

TEST(CombineTest, WeightedMeanAbsentCases) {
  EXPECT_FALSE(weightedMean({{1.0, Score()}}));
  EXPECT_FALSE(weightedMean({{0.0, Score(0.7)}}));
  EXPECT_FALSE(weightedMean({}));
}

TEST(CombineTest, MeanAndPopulationStddev) {
  EXPECT_FALSE(mean({}));
  EXPECT_FALSE(stddev({}));
  EXPECT_EQ(*stddev({4.0}), 0.0);
  EXPECT_NEAR(*mean({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 5.0, 1e-12);
  EXPECT_NEAR(*stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0, 1e-12);
}

TEST(CombineTest, FormatScore) {
  EXPECT_EQ(formatScore(Score()), "n/a");
  EXPECT_EQ(formatScore(Score(0.12345)), "0.123");
  EXPECT_EQ(formatScore(Score(72.5), 1), "72.5");
}
