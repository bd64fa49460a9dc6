// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_SPATIAL_WATER_INDEX_HPP
#define GEOMANCY_SPATIAL_WATER_INDEX_HPP

#include <optional>
#include <utility>
#include <vector>

#include "geomancy/layers.hpp"
#include "geomancy/spatial/cell_hash.hpp"

namespace geomancy {

/// Distance from a point to the segment [a, b].
double pointSegmentDistance(const Point2& p, const Point2& a, const Point2& b);

/**
 * @brief Nearest-distance lookup over water lines and points.
 *
 * Segments are bucketed on a square cell grid; a query scans rings of
 * cells outward until no unscanned cell can hold a closer segment.
 */
class WaterIndex {
 public:
  explicit WaterIndex(double cell_size = 100.0);

  /// Drainage lines of a built network as water geometry.
  static WaterIndex fromDrainage(const DrainageLayer& drainage,
                                 double cell_size = 100.0);

  void addPolyline(const Polyline& line);
  void addPoint(const Point2& point);

  /// Nearest distance [m]; absent when the index is empty.
  std::optional<double> nearestDistance(const Point2& point) const;

  bool empty() const { return segments_.empty(); }
  size_t segmentCount() const { return segments_.size(); }
  double cellSize() const { return cell_size_; }

 private:
  void insert(const Point2& a, const Point2& b);

  double cell_size_;
  std::vector<std::pair<Point2, Point2>> segments_;
  CellMap<std::vector<int>> buckets_;
  CellIndex min_cell_ = CellIndex::Zero();
  CellIndex max_cell_ = CellIndex::Zero();
};

}  // namespace geomancy

#endif  // GEOMANCY_SPATIAL_WATER_INDEX_HPP
