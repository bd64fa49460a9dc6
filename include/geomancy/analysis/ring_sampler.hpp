// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ring_sampler.hpp
 *
 * Elevation sampling on rings and sectors around a centre point.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_ANALYSIS_RING_SAMPLER_HPP
#define GEOMANCY_ANALYSIS_RING_SAMPLER_HPP

#include <optional>
#include <vector>

#include "geomancy/elevation_source.hpp"
#include "geomancy/orientation.hpp"
#include "geomancy/score.hpp"

namespace geomancy {

/// A sampled point picked by an extremum or gentle-point search.
struct RingHit {
  Point2 point;
  double elevation = 0.0;
  double azimuth = 0.0;  ///< [deg]
};

/// Integer bearings 0, step, 2*step, ... below 360.
std::vector<double> ringBearings(int step_deg);

/**
 * @brief Samples an ElevationSource at radius/azimuth offsets.
 *
 * Missing samples are dropped, never padded. Searches keep the first of
 * equal candidates.
 */
class RingSampler {
 public:
  explicit RingSampler(const ElevationSource& source) : source_(source) {}

  std::optional<double> sample(const Point2& point) const {
    return source_.sample(point);
  }

  /// Elevations that sampled successfully, in azimuth order.
  std::vector<double> ring(const Point2& center, double radius,
                           const std::vector<double>& azimuths) const;

  /// Mean of five samples at azimuth + {-30, -15, 0, 15, 30}.
  Score directionalMean(const Point2& center, double radius,
                        double azimuth) const;

  /// Extremum over `samples` azimuths evenly spread across `span`
  /// centred on `azimuth`.
  std::optional<RingHit> sectorExtremum(const Point2& center, double radius,
                                        double azimuth, ExtremumMode mode,
                                        double span = 80.0,
                                        int samples = 17) const;

  /// Extremum over the full circle at a fixed bearing step.
  std::optional<RingHit> ringExtremum(const Point2& center, double radius,
                                      ExtremumMode mode, int step = 8) const;

  /// Sample whose elevation is closest to `reference` in a
  /// +/- half_span sector around `azimuth`.
  std::optional<RingHit> gentlePoint(const Point2& center, double radius,
                                     double azimuth, double reference,
                                     double half_span = 45.0,
                                     int step = 6) const;

 private:
  const ElevationSource& source_;
};

}  // namespace geomancy

#endif  // GEOMANCY_ANALYSIS_RING_SAMPLER_HPP
