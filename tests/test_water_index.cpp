// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>

#include "geomancy/spatial/water_index.hpp"

using namespace geomancy;

// ─── Geometry ────────────────────────────────────────────────────────────────

TEST(PointSegmentTest, ProjectionAndEndpoints) {
  EXPECT_DOUBLE_EQ(pointSegmentDistance({5, 3}, {0, 0}, {10, 0}), 3.0);
  EXPECT_DOUBLE_EQ(pointSegmentDistance({-3, 4}, {0, 0}, {10, 0}), 5.0);
  EXPECT_DOUBLE_EQ(pointSegmentDistance({13, 4}, {0, 0}, {10, 0}), 5.0);
  // Degenerate segment is a point
  EXPECT_DOUBLE_EQ(pointSegmentDistance({3, 4}, {0, 0}, {0, 0}), 5.0);
}

// ─── Index ───────────────────────────────────────────────────────────────────

TEST(WaterIndexTest, EmptyIndex) {
  WaterIndex index;
  EXPECT_TRUE(index.empty());
  EXPECT_FALSE(index.nearestDistance({0, 0}));
  EXPECT_THROW(WaterIndex(0.0), std::invalid_argument);
}

TEST(WaterIndexTest, PolylineAndPoint) {
  WaterIndex index(10.0);
  index.addPolyline({{0, 0}, {100, 0}, {100, 100}});
  EXPECT_EQ(index.segmentCount(), 2u);
  EXPECT_DOUBLE_EQ(*index.nearestDistance({50, 20}), 20.0);
  EXPECT_DOUBLE_EQ(*index.nearestDistance({130, 50}), 30.0);

  index.addPoint({-500, -500});
  EXPECT_DOUBLE_EQ(*index.nearestDistance({-500, -490}), 10.0);
}

TEST(WaterIndexTest, FarQueryStillFindsNearest) {
  WaterIndex index(5.0);
  index.addPoint({0, 0});
  EXPECT_NEAR(*index.nearestDistance({3000, 4000}), 5000.0, 1e-9);
}

TEST(WaterIndexTest, MatchesBruteForce) {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> coord(-1000.0, 1000.0);

  WaterIndex index(50.0);
  std::vector<std::pair<Point2, Point2>> segments;
  for (int i = 0; i < 60; ++i) {
    const Point2 a(coord(rng), coord(rng));
    const Point2 b = a + Point2(coord(rng), coord(rng)) * 0.1;
    index.addPolyline({a, b});
    segments.emplace_back(a, b);
  }

  for (int q = 0; q < 200; ++q) {
    const Point2 p(coord(rng) * 1.5, coord(rng) * 1.5);
    double expected = std::numeric_limits<double>::max();
    for (const auto& [a, b] : segments) {
      expected = std::min(expected, pointSegmentDistance(p, a, b));
    }
    EXPECT_NEAR(*index.nearestDistance(p), expected, 1e-9);
  }
}

TEST(WaterIndexTest, FromDrainage) {
  DrainageLayer streams("drainage");
  DrainagePathRecord rec;
  rec.stream_id = 1;
  rec.points = {{0, 0}, {0, 50}};
  rec.length = 50.0;
  streams.append(rec);

  auto index = WaterIndex::fromDrainage(streams, 20.0);
  EXPECT_EQ(index.segmentCount(), 1u);
  EXPECT_DOUBLE_EQ(index.cellSize(), 20.0);
  EXPECT_DOUBLE_EQ(*index.nearestDistance({40, 25}), 40.0);
}
