// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_ring_sampler.cpp
 *
 * Tests for ring/sector sampling and compass helpers.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "geomancy/analysis/ring_sampler.hpp"
#include "geomancy/dem_raster.hpp"

using namespace geomancy;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// 100 x 100 m raster, 1 m pixels, origin at (0, 0).
DemRaster makeRaster(const std::function<float(const Point2&)>& fn) {
  DemRaster dem(100, 100, 1.0, Point2(0.0, 0.0));
  dem.fill(fn);
  return dem;
}

}  // namespace

// ─── Orientation ─────────────────────────────────────────────────────────────

TEST(OrientationTest, CardinalsPerHemisphere) {
  auto north = cardinalsFor(Hemisphere::North);
  EXPECT_EQ(north.front, 180.0);
  EXPECT_EQ(north.back, 0.0);
  EXPECT_EQ(north.left, 90.0);
  EXPECT_EQ(north.right, 270.0);

  auto south = cardinalsFor(Hemisphere::South);
  EXPECT_EQ(south.front, 0.0);
  EXPECT_EQ(south.back, 180.0);
  EXPECT_EQ(south.azimuth(Direction::Left), 270.0);
}

TEST(OrientationTest, WrapAndAzimuth) {
  EXPECT_EQ(wrapAzimuth(-90.0), 270.0);
  EXPECT_EQ(wrapAzimuth(720.0), 0.0);
  EXPECT_NEAR(azimuthBetween({0, 0}, {0, 10}), 0.0, 1e-9);
  EXPECT_NEAR(azimuthBetween({0, 0}, {10, 0}), 90.0, 1e-9);
  EXPECT_NEAR(azimuthBetween({0, 0}, {-10, 0}), 270.0, 1e-9);

  Point2 p = offsetPoint({5, 5}, 10.0, 90.0);
  EXPECT_NEAR(p.x(), 15.0, 1e-9);
  EXPECT_NEAR(p.y(), 5.0, 1e-9);
  EXPECT_STREQ(compassLabel(350.0), "N");
  EXPECT_STREQ(compassLabel(135.0), "SE");
}

TEST(OrientationTest, ParseNames) {
  EXPECT_EQ(parseHemisphere("south"), Hemisphere::South);
  EXPECT_FALSE(parseHemisphere("east"));
  EXPECT_EQ(parseDirection("left"), Direction::Left);
  EXPECT_EQ(parseExtremumMode("min"), ExtremumMode::Min);
  EXPECT_STREQ(toString(ExtremumMode::Max), "max");
}

// ─── Sampling ────────────────────────────────────────────────────────────────

TEST(RingSamplerTest, BearingsBelow360) {
  auto b = ringBearings(90);
  ASSERT_EQ(b.size(), 4u);
  EXPECT_EQ(b.back(), 270.0);
  EXPECT_EQ(ringBearings(22).size(), 17u);
  EXPECT_EQ(ringBearings(0).size(), 360u);
}

TEST(RingSamplerTest, MissingSamplesAreDropped) {
  auto dem = makeRaster([](const Point2&) { return 5.0f; });
  RingSampler sampler(dem);

  // West bearing falls outside the raster
  auto values = sampler.ring({1.0, 50.0}, 10.0, ringBearings(90));
  EXPECT_EQ(values.size(), 3u);

  auto all_out = sampler.directionalMean({-500.0, -500.0}, 10.0, 0.0);
  EXPECT_FALSE(all_out);

  auto inside = sampler.directionalMean({50.0, 50.0}, 10.0, 0.0);
  ASSERT_TRUE(inside);
  EXPECT_NEAR(*inside, 5.0, 1e-9);
}

TEST(RingSamplerTest, RingExtremumOnNorthRisingPlane) {
  auto dem = makeRaster([](const Point2& p) { return static_cast<float>(p.y()); });
  RingSampler sampler(dem);

  auto hi = sampler.ringExtremum({50.0, 50.0}, 10.0, ExtremumMode::Max, 8);
  ASSERT_TRUE(hi);
  EXPECT_EQ(hi->azimuth, 0.0);
  EXPECT_GT(hi->elevation, 59.0);

  // 8 deg bearings skip due south; the lowest lies beside it
  auto lo = sampler.ringExtremum({50.0, 50.0}, 10.0, ExtremumMode::Min, 8);
  ASSERT_TRUE(lo);
  EXPECT_GE(lo->azimuth, 160.0);
  EXPECT_LE(lo->azimuth, 200.0);
  EXPECT_LE(lo->elevation, 40.5);
}

TEST(RingSamplerTest, RingMinimumDueSouthWhenStepDivides180) {
  auto dem = makeRaster([](const Point2& p) { return static_cast<float>(p.y()); });
  RingSampler sampler(dem);
  auto lo = sampler.ringExtremum({50.0, 50.0}, 10.0, ExtremumMode::Min, 12);
  ASSERT_TRUE(lo);
  EXPECT_EQ(lo->azimuth, 180.0);
  EXPECT_LE(lo->elevation, 40.5);
}

TEST(RingSamplerTest, SectorExtremumStaysInSector) {
  auto dem = makeRaster([](const Point2& p) { return static_cast<float>(p.y()); });
  RingSampler sampler(dem);

  // East sector on a north-rising plane peaks at its northern edge
  auto hit = sampler.sectorExtremum({50.0, 50.0}, 10.0, 90.0, ExtremumMode::Max,
                                    80.0, 17);
  ASSERT_TRUE(hit);
  EXPECT_NEAR(hit->azimuth, 50.0, 1e-9);
  EXPECT_NEAR((hit->point - Point2(50.0, 50.0)).norm(), 10.0, 1e-9);
}

TEST(RingSamplerTest, SectorExtremumWrapsThroughNorth) {
  auto dem = makeRaster([](const Point2& p) { return static_cast<float>(p.x()); });
  RingSampler sampler(dem);

  auto hit = sampler.sectorExtremum({50.0, 50.0}, 10.0, 0.0, ExtremumMode::Min,
                                    80.0, 17);
  ASSERT_TRUE(hit);
  EXPECT_NEAR(hit->azimuth, 320.0, 1e-9);
}

TEST(RingSamplerTest, GentlePointNearReference) {
  auto dem = makeRaster([](const Point2& p) { return static_cast<float>(p.y()); });
  RingSampler sampler(dem);
  const double reference = *sampler.sample({50.0, 50.0});

  auto hit = sampler.gentlePoint({50.0, 50.0}, 10.0, 90.0, reference, 45.0, 6);
  ASSERT_TRUE(hit);
  EXPECT_LE(std::abs(hit->elevation - reference), 1.0);
  EXPECT_GE(hit->azimuth, 45.0);
  EXPECT_LE(hit->azimuth, 135.0);
}

TEST(RingSamplerTest, NoHitOutsideRaster) {
  auto dem = makeRaster([](const Point2&) { return 1.0f; });
  RingSampler sampler(dem);
  EXPECT_FALSE(sampler.ringExtremum({-1000.0, -1000.0}, 5.0, ExtremumMode::Max));
  EXPECT_FALSE(sampler.gentlePoint({-1000.0, -1000.0}, 5.0, 0.0, 1.0));
}
