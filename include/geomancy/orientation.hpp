// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_ORIENTATION_HPP
#define GEOMANCY_ORIENTATION_HPP

#include <optional>
#include <string>

#include "geomancy/point_types.hpp"

namespace geomancy {

/// Selects which compass bearing counts as the site's "front".
enum class Hemisphere { North, South };

/// Relative direction around a site.
enum class Direction { Front, Back, Left, Right };

/// Which sample a sector/ring search keeps.
enum class ExtremumMode { Max, Min };

/// Compass azimuths [deg] of the four relative directions.
struct Cardinals {
  double front;
  double back;
  double left;
  double right;

  double azimuth(Direction direction) const;
};

/// North: front 180, back 0, left 90, right 270. South mirrors it.
Cardinals cardinalsFor(Hemisphere hemisphere);

std::optional<Hemisphere> parseHemisphere(const std::string& name);
std::optional<Direction> parseDirection(const std::string& name);
std::optional<ExtremumMode> parseExtremumMode(const std::string& name);

const char* toString(Hemisphere hemisphere);
const char* toString(Direction direction);
const char* toString(ExtremumMode mode);

/// Wrap an angle into [0, 360).
double wrapAzimuth(double degrees);

/// Compass azimuth of (to - from), clockwise from north, in [0, 360).
double azimuthBetween(const Point2& from, const Point2& to);

/// Point at `distance` along compass `azimuth_deg` (x += d sin, y += d cos).
Point2 offsetPoint(const Point2& center, double distance, double azimuth_deg);

/// 8-point compass label (N, NE, ... NW) of an azimuth.
const char* compassLabel(double azimuth);

}  // namespace geomancy

#endif  // GEOMANCY_ORIENTATION_HPP
