// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONTEXT_HPP
#define GEOMANCY_CONTEXT_HPP

#include <string>

#include "geomancy/config/geomancy.hpp"
#include "geomancy/orientation.hpp"

namespace geomancy {

/// Per-call parameters merged from one culture and one period.
struct CulturalContext {
  std::string culture_key = config::kDefaultCulture;
  std::string period_key = config::kDefaultPeriod;
  Hemisphere hemisphere = Hemisphere::North;
  double aspect_target = 180.0;
  double aspect_sharpness = 1.0;
  double water_distance_target = 220.0;
  double water_distance_sigma = 350.0;
  double macro_radius_multiplier = 1.0;
  double micro_radius_multiplier = 1.0;
  double candidate_threshold = 0.62;
  config::BiasMap weight_bias;
  config::BiasMap term_bias;
  double term_target_shift = 0.0;

  double termBias(const std::string& term_id) const;
};

/**
 * @brief Merge a culture and a period into a context.
 *
 * Unknown keys fall back to the default culture/period (with a warning).
 * Water sigma is floored at 120 m and the candidate threshold is clamped
 * to [0.50, 0.90].
 */
CulturalContext buildContext(const Config& cfg, const std::string& culture_key,
                             const std::string& period_key,
                             Hemisphere hemisphere);

}  // namespace geomancy

#endif  // GEOMANCY_CONTEXT_HPP
