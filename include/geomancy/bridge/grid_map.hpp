// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_BRIDGE_GRID_MAP_HPP
#define GEOMANCY_BRIDGE_GRID_MAP_HPP

#include <cmath>
#include <optional>
#include <string>
#include <utility>

#include <grid_map_core/GridMap.hpp>

#include "geomancy/dem_raster.hpp"
#include "geomancy/elevation_source.hpp"

namespace geomancy {

/// Read-only ElevationSource view of one grid_map layer.
class GridMapElevation : public ElevationSource {
 public:
  GridMapElevation(const grid_map::GridMap& map, std::string layer)
      : map_(map), layer_(std::move(layer)) {}

  std::optional<double> sample(const Point2& point) const override {
    const grid_map::Position pos(point.x(), point.y());
    if (!map_.isInside(pos)) return std::nullopt;
    const float z = map_.atPosition(layer_, pos);
    if (!std::isfinite(z)) return std::nullopt;
    return static_cast<double>(z);
  }

  double pixelSizeX() const override { return map_.getResolution(); }
  double pixelSizeY() const override { return map_.getResolution(); }

  Extent extent() const override {
    const auto& c = map_.getPosition();
    const auto& len = map_.getLength();
    return {c.x() - 0.5 * len.x(), c.y() - 0.5 * len.y(),
            c.x() + 0.5 * len.x(), c.y() + 0.5 * len.y()};
  }

 private:
  const grid_map::GridMap& map_;
  std::string layer_;
};

/// Copy a DemRaster into a new grid_map layer (map geometry is reset).
inline void toGridMap(const DemRaster& dem, const std::string& layer,
                      grid_map::GridMap& map) {
  const Extent e = dem.extent();
  map.setGeometry(grid_map::Length(e.width(), e.height()), dem.resolution(),
                  grid_map::Position(0.5 * (e.x_min + e.x_max),
                                     0.5 * (e.y_min + e.y_max)));
  map.add(layer, NAN);
  for (int r = 0; r < dem.rows(); ++r) {
    for (int c = 0; c < dem.cols(); ++c) {
      const Point2 p = dem.pixelCenter(r, c);
      grid_map::Index idx;
      if (map.getIndex(grid_map::Position(p.x(), p.y()), idx)) {
        map.at(layer, idx) = dem.at(r, c);
      }
    }
  }
}

}  // namespace geomancy

#endif  // GEOMANCY_BRIDGE_GRID_MAP_HPP
