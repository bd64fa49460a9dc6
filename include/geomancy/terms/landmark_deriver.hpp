// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * landmark_deriver.hpp
 *
 * Named directional landmarks around selected core-point candidates.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_TERMS_LANDMARK_DERIVER_HPP
#define GEOMANCY_TERMS_LANDMARK_DERIVER_HPP

#include <vector>

#include "geomancy/analysis/ring_sampler.hpp"
#include "geomancy/config/geomancy.hpp"
#include "geomancy/context.hpp"
#include "geomancy/layers.hpp"
#include "geomancy/search/candidate_search.hpp"

namespace geomancy {

/// Search radii of the three radius classes [m].
struct TermRadii {
  double inner = 0.0;
  double outer = 0.0;
  double far = 0.0;

  double of(RadiusClass radius_class) const;
};

/**
 * @brief Derives landmark points for every candidate.
 *
 * The core point and the basin are always emitted. Catalog terms, the
 * inflow point and the apron point are emitted when sampling finds them
 * and their biased score reaches the floor.
 */
class LandmarkDeriver {
 public:
  LandmarkDeriver(const ElevationSource& source, const Config& cfg);

  TermRadii radii(const CulturalContext& ctx) const;

  /// max(min_score, candidate threshold x threshold_ratio)
  double scoreFloor(const CulturalContext& ctx) const;

  /// Ring range at the outer radius, at least 1 m.
  double localRelief(const Point2& center, double outer_radius) const;

  /// Candidates are expected in rank order; parent ids start at 1.
  LandmarkLayer derive(const std::vector<Candidate>& candidates,
                       const CulturalContext& ctx) const;

 private:
  void deriveFor(const Candidate& candidate, int rank, int total,
                 const CulturalContext& ctx, LandmarkLayer& layer) const;

  RingSampler sampler_;
  config::Sampling sampling_;
  config::Terms terms_;
  double step_;
};

}  // namespace geomancy

#endif  // GEOMANCY_TERMS_LANDMARK_DERIVER_HPP
