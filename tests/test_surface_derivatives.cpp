// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>

#include "geomancy/analysis/surface_derivatives.hpp"
#include "geomancy/dem_raster.hpp"

using namespace geomancy;

TEST(SurfaceDerivativesTest, EastRisingPlane) {
  DemRaster dem(20, 20, 2.0, Point2(0.0, 0.0));
  dem.fill([](const Point2& p) { return static_cast<float>(p.x()); });

  auto g = surfaceDerivatives(dem, dem.pixelCenter(10, 10));
  ASSERT_TRUE(g.slope_deg);
  ASSERT_TRUE(g.aspect_deg);
  EXPECT_NEAR(*g.slope_deg, 45.0, 1e-6);
  // Downslope faces west
  EXPECT_NEAR(*g.aspect_deg, 270.0, 1e-6);
}

TEST(SurfaceDerivativesTest, SouthFacingSlope) {
  DemRaster dem(20, 20, 1.0, Point2(0.0, 0.0));
  dem.fill([](const Point2& p) { return static_cast<float>(0.5 * p.y()); });

  auto g = surfaceDerivatives(dem, dem.pixelCenter(10, 10));
  ASSERT_TRUE(g.aspect_deg);
  EXPECT_NEAR(*g.aspect_deg, 180.0, 1e-6);
  EXPECT_NEAR(*g.slope_deg, std::atan(0.5) * 180.0 / M_PI, 1e-4);
}

TEST(SurfaceDerivativesTest, FlatHasNoAspect) {
  DemRaster dem(10, 10, 1.0, Point2(0.0, 0.0), 7.0f);
  auto g = surfaceDerivatives(dem, dem.pixelCenter(5, 5));
  ASSERT_TRUE(g.slope_deg);
  EXPECT_EQ(*g.slope_deg, 0.0);
  EXPECT_FALSE(g.aspect_deg);
}

TEST(SurfaceDerivativesTest, EdgeOrNodataIsAbsent) {
  DemRaster dem(10, 10, 1.0, Point2(0.0, 0.0), 1.0f);
  auto edge = surfaceDerivatives(dem, dem.pixelCenter(0, 0));
  EXPECT_FALSE(edge.slope_deg);

  dem.at(4, 5) = NAN;
  auto hole = surfaceDerivatives(dem, dem.pixelCenter(5, 5));
  EXPECT_FALSE(hole.slope_deg);
  EXPECT_FALSE(hole.aspect_deg);
}
