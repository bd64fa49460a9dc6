// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/orientation.hpp"

#include <array>
#include <cmath>

namespace geomancy {

namespace {
constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;
}  // namespace

double Cardinals::azimuth(Direction direction) const {
  switch (direction) {
    case Direction::Front:
      return front;
    case Direction::Back:
      return back;
    case Direction::Left:
      return left;
    case Direction::Right:
      return right;
  }
  return front;
}

Cardinals cardinalsFor(Hemisphere hemisphere) {
  if (hemisphere == Hemisphere::South) {
    return {0.0, 180.0, 270.0, 90.0};
  }
  return {180.0, 0.0, 90.0, 270.0};
}

std::optional<Hemisphere> parseHemisphere(const std::string& name) {
  if (name == "north") return Hemisphere::North;
  if (name == "south") return Hemisphere::South;
  return std::nullopt;
}

std::optional<Direction> parseDirection(const std::string& name) {
  if (name == "front") return Direction::Front;
  if (name == "back") return Direction::Back;
  if (name == "left") return Direction::Left;
  if (name == "right") return Direction::Right;
  return std::nullopt;
}

std::optional<ExtremumMode> parseExtremumMode(const std::string& name) {
  if (name == "max") return ExtremumMode::Max;
  if (name == "min") return ExtremumMode::Min;
  return std::nullopt;
}

const char* toString(Hemisphere hemisphere) {
  return hemisphere == Hemisphere::South ? "south" : "north";
}

const char* toString(Direction direction) {
  switch (direction) {
    case Direction::Front:
      return "front";
    case Direction::Back:
      return "back";
    case Direction::Left:
      return "left";
    case Direction::Right:
      return "right";
  }
  return "front";
}

const char* toString(ExtremumMode mode) {
  return mode == ExtremumMode::Min ? "min" : "max";
}

double wrapAzimuth(double degrees) {
  double wrapped = std::fmod(degrees, 360.0);
  if (wrapped < 0.0) wrapped += 360.0;
  // fmod of a tiny negative value can round back up to 360
  if (wrapped >= 360.0) wrapped = 0.0;
  return wrapped;
}

double azimuthBetween(const Point2& from, const Point2& to) {
  const Point2 d = to - from;
  return wrapAzimuth(std::atan2(d.x(), d.y()) * kRadToDeg);
}

Point2 offsetPoint(const Point2& center, double distance, double azimuth_deg) {
  const double rad = azimuth_deg * kDegToRad;
  return {center.x() + distance * std::sin(rad),
          center.y() + distance * std::cos(rad)};
}

const char* compassLabel(double azimuth) {
  static constexpr std::array<const char*, 8> kLabels = {
      "N", "NE", "E", "SE", "S", "SW", "W", "NW"};
  const int idx =
      static_cast<int>(std::floor((wrapAzimuth(azimuth) + 22.5) / 45.0)) % 8;
  return kLabels[idx];
}

}  // namespace geomancy
