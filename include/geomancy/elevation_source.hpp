// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * elevation_source.hpp
 *
 * Read-only point sampling interface over an elevation raster.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_ELEVATION_SOURCE_HPP
#define GEOMANCY_ELEVATION_SOURCE_HPP

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>

#include "geomancy/point_types.hpp"

namespace geomancy {

/**
 * @brief Elevation raster seen as a sampling service.
 *
 * Implementations return std::nullopt for points outside the extent and for
 * nodata pixels. Sampling must be const and free of side effects; every
 * analysis treats the source as shared, read-only input.
 */
class ElevationSource {
 public:
  using Ptr = std::shared_ptr<ElevationSource>;
  using ConstPtr = std::shared_ptr<const ElevationSource>;

  virtual ~ElevationSource() = default;

  /// Elevation at a planar point [m], or nullopt when not available.
  virtual std::optional<double> sample(const Point2& point) const = 0;

  /// Pixel size along x / y [m] (sign ignored).
  virtual double pixelSizeX() const = 0;
  virtual double pixelSizeY() const = 0;

  /// Raster bounds [m].
  virtual Extent extent() const = 0;

  /// Characteristic sampling step: the coarser pixel size, 1 if degenerate.
  double step() const {
    const double s = std::max(std::abs(pixelSizeX()), std::abs(pixelSizeY()));
    return s > 0.0 ? s : 1.0;
  }
};

}  // namespace geomancy

#endif  // GEOMANCY_ELEVATION_SOURCE_HPP
