// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_context.cpp
 *
 * Tests for merging culture and period tables into a context.
 */

#include <gtest/gtest.h>

#include "geomancy/context.hpp"

using namespace geomancy;

TEST(ContextTest, DefaultKeys) {
  Config cfg;
  auto ctx = buildContext(cfg, "east_asia", "early_modern", Hemisphere::North);
  EXPECT_EQ(ctx.culture_key, "east_asia");
  EXPECT_EQ(ctx.period_key, "early_modern");
  EXPECT_DOUBLE_EQ(ctx.aspect_target, 180.0);
  EXPECT_DOUBLE_EQ(ctx.water_distance_target, 220.0);
  EXPECT_DOUBLE_EQ(ctx.candidate_threshold, 0.62);
  EXPECT_DOUBLE_EQ(ctx.weight_bias.at("aspect"), 0.02);
}

TEST(ContextTest, CultureAndPeriodMerge) {
  Config cfg;
  auto ctx = buildContext(cfg, "korea", "ancient", Hemisphere::North);
  EXPECT_DOUBLE_EQ(ctx.water_distance_target, 240.0);
  EXPECT_DOUBLE_EQ(ctx.water_distance_sigma, 350.0);
  EXPECT_NEAR(ctx.macro_radius_multiplier, 1.10 * 1.15, 1e-12);
  EXPECT_NEAR(ctx.candidate_threshold, 0.66, 1e-12);
  EXPECT_NEAR(ctx.weight_bias.at("form"), 0.09, 1e-12);
  EXPECT_NEAR(ctx.weight_bias.at("long"), 0.09, 1e-12);
  EXPECT_NEAR(ctx.term_target_shift, 0.03, 1e-12);
  EXPECT_NEAR(ctx.termBias(term::near_front_peak), 0.05, 1e-12);
  EXPECT_EQ(ctx.termBias(term::far_back_peak), 0.0);
}

TEST(ContextTest, HemisphereSelectsAspectTarget) {
  Config cfg;
  auto north = buildContext(cfg, "japan", "modern", Hemisphere::North);
  auto south = buildContext(cfg, "japan", "modern", Hemisphere::South);
  EXPECT_DOUBLE_EQ(north.aspect_target, 170.0);
  EXPECT_DOUBLE_EQ(south.aspect_target, 350.0);
  EXPECT_EQ(south.hemisphere, Hemisphere::South);
}

TEST(ContextTest, UnknownKeysFallBack) {
  Config cfg;
  auto ctx = buildContext(cfg, "atlantis", "future", Hemisphere::North);
  EXPECT_EQ(ctx.culture_key, config::kDefaultCulture);
  EXPECT_EQ(ctx.period_key, config::kDefaultPeriod);
}

TEST(ContextTest, EmptyCatalogsUseBuiltInValues) {
  Config cfg;
  cfg.cultures.clear();
  cfg.periods.clear();
  auto ctx = buildContext(cfg, "korea", "ancient", Hemisphere::North);
  EXPECT_EQ(ctx.culture_key, config::kDefaultCulture);
  EXPECT_DOUBLE_EQ(ctx.candidate_threshold, config::Culture().candidate_threshold);
}

TEST(ContextTest, SigmaFloorAndThresholdClamp) {
  Config cfg;
  config::Culture narrow;
  narrow.water_distance_sigma = 50.0;
  narrow.candidate_threshold = 0.95;
  cfg.cultures["narrow"] = narrow;

  config::Period loose;
  loose.threshold_shift = -0.8;
  cfg.periods["loose"] = loose;

  auto high = buildContext(cfg, "narrow", "early_modern", Hemisphere::North);
  EXPECT_DOUBLE_EQ(high.water_distance_sigma, 120.0);
  EXPECT_DOUBLE_EQ(high.candidate_threshold, 0.90);

  auto low = buildContext(cfg, "narrow", "loose", Hemisphere::North);
  EXPECT_DOUBLE_EQ(low.candidate_threshold, 0.50);
}
