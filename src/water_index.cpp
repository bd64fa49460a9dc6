// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/spatial/water_index.hpp"

#include <algorithm>
#include <stdexcept>

namespace geomancy {

double pointSegmentDistance(const Point2& p, const Point2& a, const Point2& b) {
  const Point2 ab = b - a;
  const double len_sq = ab.squaredNorm();
  if (len_sq <= 0.0) return (p - a).norm();
  const double t = std::clamp((p - a).dot(ab) / len_sq, 0.0, 1.0);
  return (p - (a + t * ab)).norm();
}

WaterIndex::WaterIndex(double cell_size) : cell_size_(cell_size) {
  if (!(cell_size > 0.0)) {
    throw std::invalid_argument("WaterIndex cell size must be positive");
  }
}

WaterIndex WaterIndex::fromDrainage(const DrainageLayer& drainage,
                                    double cell_size) {
  WaterIndex index(cell_size);
  for (const auto& stream : drainage) index.addPolyline(stream.points);
  return index;
}

void WaterIndex::addPolyline(const Polyline& line) {
  if (line.size() == 1) {
    insert(line.front(), line.front());
    return;
  }
  for (size_t i = 1; i < line.size(); ++i) insert(line[i - 1], line[i]);
}

void WaterIndex::addPoint(const Point2& point) { insert(point, point); }

void WaterIndex::insert(const Point2& a, const Point2& b) {
  const int id = static_cast<int>(segments_.size());
  segments_.emplace_back(a, b);

  const CellIndex ca = cellOf(a, cell_size_);
  const CellIndex cb = cellOf(b, cell_size_);
  const CellIndex lo = ca.cwiseMin(cb);
  const CellIndex hi = ca.cwiseMax(cb);
  for (int x = lo.x(); x <= hi.x(); ++x) {
    for (int y = lo.y(); y <= hi.y(); ++y) {
      buckets_[CellIndex(x, y)].push_back(id);
    }
  }
  if (id == 0) {
    min_cell_ = lo;
    max_cell_ = hi;
  } else {
    min_cell_ = min_cell_.cwiseMin(lo);
    max_cell_ = max_cell_.cwiseMax(hi);
  }
}

std::optional<double> WaterIndex::nearestDistance(const Point2& point) const {
  if (segments_.empty()) return std::nullopt;

  const CellIndex center = cellOf(point, cell_size_);
  // Ring beyond which no occupied cell exists
  const CellIndex far = (center - min_cell_).cwiseAbs().cwiseMax(
      (max_cell_ - center).cwiseAbs());
  const int max_ring = far.maxCoeff();

  std::optional<double> best;
  std::vector<uint8_t> seen(segments_.size(), 0);
  auto scan = [&](int x, int y) {
    auto it = buckets_.find(CellIndex(x, y));
    if (it == buckets_.end()) return;
    for (int id : it->second) {
      if (seen[id]) continue;
      seen[id] = 1;
      const auto& [a, b] = segments_[id];
      const double d = pointSegmentDistance(point, a, b);
      if (!best || d < *best) best = d;
    }
  };

  for (int r = 0; r <= max_ring; ++r) {
    if (r == 0) {
      scan(center.x(), center.y());
    } else {
      for (int d = -r; d <= r; ++d) {
        scan(center.x() + d, center.y() - r);
        scan(center.x() + d, center.y() + r);
      }
      for (int d = -r + 1; d <= r - 1; ++d) {
        scan(center.x() - r, center.y() + d);
        scan(center.x() + r, center.y() + d);
      }
    }
    // Cells of ring r + 1 are at least r cells away
    if (best && *best <= r * cell_size_) break;
  }
  return best;
}

}  // namespace geomancy
