// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/analysis/surface_derivatives.hpp"

#include <cmath>

#include "geomancy/orientation.hpp"

namespace geomancy {

SurfaceGradient surfaceDerivatives(const ElevationSource& source,
                                   const Point2& point) {
  const double px = std::abs(source.pixelSizeX()) > 0.0
                        ? std::abs(source.pixelSizeX())
                        : source.step();
  const double py = std::abs(source.pixelSizeY()) > 0.0
                        ? std::abs(source.pixelSizeY())
                        : source.step();

  // z[r][c]: r = 0 north row, c = 0 west column
  double z[3][3];
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      const Point2 p(point.x() + (c - 1) * px, point.y() + (1 - r) * py);
      auto v = source.sample(p);
      if (!v) return {};
      z[r][c] = *v;
    }
  }

  const double dzdx = ((z[0][2] + 2.0 * z[1][2] + z[2][2]) -
                       (z[0][0] + 2.0 * z[1][0] + z[2][0])) /
                      (8.0 * px);
  const double dzdy = ((z[0][0] + 2.0 * z[0][1] + z[0][2]) -
                       (z[2][0] + 2.0 * z[2][1] + z[2][2])) /
                      (8.0 * py);

  SurfaceGradient out;
  const double gradient = std::hypot(dzdx, dzdy);
  out.slope_deg = std::atan(gradient) * 180.0 / M_PI;
  if (gradient > 0.0) {
    // Downslope direction is the negative gradient
    out.aspect_deg = wrapAzimuth(std::atan2(-dzdx, -dzdy) * 180.0 / M_PI);
  }
  return out;
}

}  // namespace geomancy
