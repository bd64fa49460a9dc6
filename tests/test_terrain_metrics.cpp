// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_terrain_metrics.cpp
 *
 * Tests for ring-based terrain shape metrics.
 */

#include <gtest/gtest.h>

#include "geomancy/analysis/terrain_metrics.hpp"
#include "geomancy/dem_raster.hpp"

using namespace geomancy;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

const Point2 kCenter(100.0, 100.0);

/// 200 x 200 m raster, 1 m pixels, z = base + gain * distance to the centre.
DemRaster radialRaster(double base, double gain) {
  DemRaster dem(200, 200, 1.0, Point2(0.0, 0.0));
  dem.fill([&](const Point2& p) {
    return static_cast<float>(base + gain * (p - kCenter).norm());
  });
  return dem;
}

class TerrainMetricsTest : public ::testing::Test {
 protected:
  Config cfg;
  CulturalContext ctx;
};

}  // namespace

// ─── Radii ───────────────────────────────────────────────────────────────────

TEST_F(TerrainMetricsTest, RadiiScaleWithStepAndContext) {
  DemRaster dem(50, 50, 2.0, Point2(0.0, 0.0), 0.0f);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  EXPECT_DOUBLE_EQ(engine.step(), 2.0);
  EXPECT_DOUBLE_EQ(engine.microRadius(ctx), 4.0);
  EXPECT_DOUBLE_EQ(engine.macroRadius(ctx), 24.0);

  ctx.macro_radius_multiplier = 1.5;
  EXPECT_DOUBLE_EQ(engine.macroRadius(ctx), 36.0);
}

// ─── Shape metrics ───────────────────────────────────────────────────────────

TEST_F(TerrainMetricsTest, PeakDoesNotConverge) {
  auto dem = radialRaster(100.0, -0.5);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  auto m = engine.compute(kCenter, Score(), ctx);

  ASSERT_TRUE(m.center);
  ASSERT_TRUE(m.relief);
  ASSERT_TRUE(m.tpi);
  ASSERT_TRUE(m.convergence);
  EXPECT_GT(*m.tpi, 0.0);
  EXPECT_NEAR(*m.convergence, 0.0, 1e-9);
  EXPECT_TRUE(m.form_score);
  EXPECT_TRUE(m.long_score);
}

TEST_F(TerrainMetricsTest, BowlConverges) {
  auto dem = radialRaster(10.0, 0.5);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  auto m = engine.compute(kCenter, Score(), ctx);

  ASSERT_TRUE(m.convergence);
  ASSERT_TRUE(m.tpi);
  EXPECT_GT(*m.convergence, 0.99);
  EXPECT_LT(*m.tpi, 0.0);
  ASSERT_TRUE(m.wetness);
  EXPECT_GE(*m.wetness, 0.0);
  EXPECT_LE(*m.wetness, 1.0);
}

TEST_F(TerrainMetricsTest, FlatRasterHasNoRelief) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0), 42.0f);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  auto m = engine.compute({50.0, 50.0}, Score(), ctx);

  ASSERT_TRUE(m.relief);
  EXPECT_EQ(*m.relief, 0.0);
  EXPECT_FALSE(m.form_score);
  EXPECT_FALSE(m.long_score);
  EXPECT_FALSE(m.tpi);
  ASSERT_TRUE(m.convergence);
  EXPECT_EQ(*m.convergence, 0.0);
  EXPECT_TRUE(m.wetness);
}

TEST_F(TerrainMetricsTest, SlopeScalesWetness) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0), 42.0f);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  const Point2 site(50.0, 50.0);

  const double flat = *engine.compute(site, Score(0.0), ctx).wetness;
  const double unknown = *engine.compute(site, Score(), ctx).wetness;
  const double steep = *engine.compute(site, Score(60.0), ctx).wetness;
  EXPECT_GT(flat, unknown);
  EXPECT_GT(unknown, steep);
  // Steep slopes bottom out at the minimum factor
  EXPECT_NEAR(steep / flat, 0.6 + 0.4 * cfg.terrain_metrics.min_slope_factor,
              1e-9);
}

TEST_F(TerrainMetricsTest, OutsideRasterIsAbsent) {
  DemRaster dem(20, 20, 1.0, Point2(0.0, 0.0), 1.0f);
  TerrainMetricEngine engine(dem, cfg.sampling, cfg.terrain_metrics);
  auto m = engine.compute({-50.0, -50.0}, Score(5.0), ctx);
  EXPECT_FALSE(m.center);
  EXPECT_FALSE(m.relief);
  EXPECT_FALSE(m.convergence);
  EXPECT_FALSE(m.wetness);
}
