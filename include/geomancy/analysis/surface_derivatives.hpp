// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_ANALYSIS_SURFACE_DERIVATIVES_HPP
#define GEOMANCY_ANALYSIS_SURFACE_DERIVATIVES_HPP

#include "geomancy/elevation_source.hpp"
#include "geomancy/score.hpp"

namespace geomancy {

struct SurfaceGradient {
  Score slope_deg;   ///< Steepest slope angle [deg]
  Score aspect_deg;  ///< Downslope compass direction [deg], absent when flat
};

/// Horn 3x3 slope/aspect at a point, using one-pixel offsets.
/// Absent if any of the nine samples is missing.
SurfaceGradient surfaceDerivatives(const ElevationSource& source,
                                   const Point2& point);

}  // namespace geomancy

#endif  // GEOMANCY_ANALYSIS_SURFACE_DERIVATIVES_HPP
