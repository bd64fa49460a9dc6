// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Planar geometry types shared across geomancy.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_POINT_TYPES_HPP
#define GEOMANCY_POINT_TYPES_HPP

#include <Eigen/Core>
#include <cmath>
#include <vector>

namespace geomancy {

/// Planar map point (x east, y north) in metres.
using Point2 = Eigen::Vector2d;

/// Ordered vertices of a line geometry.
using Polyline = std::vector<Point2>;

/// Axis-aligned bounds of a raster or feature set [m].
struct Extent {
  double x_min = 0.0;
  double y_min = 0.0;
  double x_max = 0.0;
  double y_max = 0.0;

  double width() const { return x_max - x_min; }
  double height() const { return y_max - y_min; }
  double diagonal() const { return std::hypot(width(), height()); }
  bool isEmpty() const { return width() <= 0.0 || height() <= 0.0; }
};

/// Sum of consecutive vertex distances.
inline double polylineLength(const Polyline& line) {
  double length = 0.0;
  for (size_t i = 1; i < line.size(); ++i) {
    length += (line[i] - line[i - 1]).norm();
  }
  return length;
}

}  // namespace geomancy

#endif  // GEOMANCY_POINT_TYPES_HPP
