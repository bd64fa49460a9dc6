// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_candidate_search.cpp
 *
 * Tests for grid spacing, candidate collection and near-duplicate
 * suppression.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "geomancy/context.hpp"
#include "geomancy/dem_raster.hpp"
#include "geomancy/search/candidate_search.hpp"

using namespace geomancy;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

Candidate makeCandidate(double x, double y, double score) {
  Candidate c;
  c.point = Point2(x, y);
  c.score = score;
  return c;
}

/// Ridge-and-valley terrain with a peak in the north-west.
DemRaster rollingRaster() {
  DemRaster dem(300, 300, 1.0, Point2(0.0, 0.0));
  dem.fill([](const Point2& p) {
    const double hill = 60.0 * std::exp(-(p - Point2(80.0, 220.0)).squaredNorm() /
                                         (2.0 * 60.0 * 60.0));
    return static_cast<float>(hill + 8.0 * std::sin(p.x() / 35.0) +
                              0.05 * p.y());
  });
  return dem;
}

/// Single peak, 100 m at the centre falling 1 m per metre.
DemRaster coneRaster(int size) {
  DemRaster dem(size, size, 1.0, Point2(0.0, 0.0));
  const Point2 apex(0.5 * size, 0.5 * size);
  dem.fill([apex](const Point2& p) {
    return static_cast<float>(100.0 - (p - apex).norm());
  });
  return dem;
}

}  // namespace

// ─── Spacing ─────────────────────────────────────────────────────────────────

TEST(CandidateSpacingTest, StepFactorAndSpan) {
  config::CandidateSearch cfg;
  EXPECT_DOUBLE_EQ(adaptiveSpacing({0, 0, 100, 100}, 1.0, cfg), 10.0);
  // Long spans dominate small steps
  cfg.max_cells = 1'000'000;
  EXPECT_DOUBLE_EQ(adaptiveSpacing({0, 0, 36000, 36000}, 1.0, cfg), 200.0);
}

TEST(CandidateSpacingTest, CellCapGrowsSpacing) {
  config::CandidateSearch cfg;
  cfg.max_cells = 100;
  const Extent e{0, 0, 1000, 1000};
  const double spacing = adaptiveSpacing(e, 1.0, cfg);
  EXPECT_GT(spacing, 10.0);
  const double cells = (1000.0 / spacing) * (1000.0 / spacing);
  EXPECT_LE(cells, 110.0);
}

TEST(CandidateSpacingTest, RecommendedCountShrinksWithDensity) {
  EXPECT_EQ(recommendedCandidateCount({0, 0, 100, 100}, 10.0), 5);
  EXPECT_EQ(recommendedCandidateCount({0, 0, 100, 100}, 1.0), 4);
  EXPECT_EQ(recommendedCandidateCount({0, 0, 120, 120}, 1.0), 3);
  EXPECT_EQ(recommendedCandidateCount({0, 0, 200, 200}, 1.0), 2);
}

// ─── Suppression ─────────────────────────────────────────────────────────────

TEST(SuppressionTest, KeepsBestAndSkipsNeighbours) {
  std::vector<Candidate> sorted = {
      makeCandidate(0, 0, 0.9), makeCandidate(5, 0, 0.85),
      makeCandidate(20, 0, 0.8), makeCandidate(21, 0, 0.7),
      makeCandidate(50, 0, 0.6)};

  auto kept = suppressNearDuplicates(sorted, 10.0, 5);
  ASSERT_EQ(kept.size(), 3u);
  EXPECT_EQ(kept[0].point, Point2(0, 0));
  EXPECT_EQ(kept[1].point, Point2(20, 0));
  EXPECT_EQ(kept[2].point, Point2(50, 0));

  auto limited = suppressNearDuplicates(sorted, 10.0, 2);
  EXPECT_EQ(limited.size(), 2u);
  EXPECT_TRUE(suppressNearDuplicates(sorted, 10.0, 0).empty());
}

TEST(SuppressionTest, ExactSeparationIsKept) {
  std::vector<Candidate> sorted = {makeCandidate(0, 0, 0.9),
                                   makeCandidate(10, 0, 0.8)};
  EXPECT_EQ(suppressNearDuplicates(sorted, 10.0, 5).size(), 2u);
}

// ─── Search ──────────────────────────────────────────────────────────────────

TEST(CandidateSearchTest, FlatRasterWithZeroThreshold) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0), 10.0f);
  Config cfg;
  CandidateSearch search(dem, cfg);
  CulturalContext ctx;
  ctx.candidate_threshold = 0.0;

  auto result = search.run(ctx, 3, CancellationToken());
  EXPECT_DOUBLE_EQ(result.spacing, 10.0);
  EXPECT_EQ(result.passed, 100u);
  EXPECT_EQ(result.desired, 3);
  EXPECT_DOUBLE_EQ(result.separation, 105.0);
  ASSERT_FALSE(result.selected.empty());
  EXPECT_LE(result.selected.size(), 3u);

  // Equal scores keep scan order: first column, first row
  EXPECT_EQ(result.selected[0].point, Point2(5.0, 5.0));
  for (size_t i = 0; i < result.selected.size(); ++i) {
    for (size_t j = i + 1; j < result.selected.size(); ++j) {
      EXPECT_GE((result.selected[i].point - result.selected[j].point).norm(),
                result.separation);
    }
  }
}

TEST(CandidateSearchTest, CollectedCandidatesRespectFilters) {
  auto dem = rollingRaster();
  Config cfg;
  CandidateSearch search(dem, cfg);
  CulturalContext ctx;
  ctx.candidate_threshold = 0.3;

  auto candidates = search.collect(ctx, 15.0, CancellationToken());
  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& c = candidates[i];
    EXPECT_GE(c.score, ctx.candidate_threshold);
    EXPECT_LE(c.score, 1.0);
    if (c.metrics.tpi) {
      EXPECT_GE(*c.metrics.tpi, cfg.candidate_search.tpi_min);
      EXPECT_LE(*c.metrics.tpi, cfg.candidate_search.tpi_max);
    }
    if (i > 0) EXPECT_GE(candidates[i - 1].score, c.score);
  }
}

TEST(CandidateSearchTest, ThresholdAboveOneKeepsNothing) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0), 10.0f);
  Config cfg;
  CandidateSearch search(dem, cfg);
  CulturalContext ctx;
  ctx.candidate_threshold = 1.01;

  auto result = search.run(ctx, 5, CancellationToken());
  EXPECT_EQ(result.passed, 0u);
  EXPECT_TRUE(result.selected.empty());
}

TEST(CandidateSearchTest, CancelledTokenThrows) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0), 10.0f);
  Config cfg;
  CandidateSearch search(dem, cfg);
  CancellationToken token;
  token.cancel();
  EXPECT_THROW(search.collect(CulturalContext(), 10.0, token),
               OperationCancelled);
}

// ─── Single peak ─────────────────────────────────────────────────────────────

TEST(CandidateSearchTest, SmallConeHasNoCells) {
  auto dem = coneRaster(5);
  Config cfg;
  CandidateSearch search(dem, cfg);
  auto ctx = buildContext(cfg, "east_asia", "early_modern", Hemisphere::North);

  auto result = search.run(ctx, 5, CancellationToken());
  // Spacing of ten steps exceeds the 5 m extent
  EXPECT_GT(result.spacing, 5.0);
  EXPECT_EQ(result.passed, 0u);
  EXPECT_TRUE(result.selected.empty());
}

TEST(CandidateSearchTest, ConeApexIsNotSelected) {
  auto dem = coneRaster(200);
  Config cfg;
  CandidateSearch search(dem, cfg);
  auto ctx = buildContext(cfg, "east_asia", "early_modern", Hemisphere::North);

  auto result = search.run(ctx, 5, CancellationToken());
  ASSERT_FALSE(result.selected.empty());
  const Point2 apex(100.0, 100.0);
  for (const auto& c : result.selected) {
    EXPECT_GT((c.point - apex).norm(), 2.0 * result.spacing)
        << "candidate at " << c.point.transpose();
  }
}
