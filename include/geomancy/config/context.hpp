// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONFIG_CONTEXT_HPP
#define GEOMANCY_CONFIG_CONTEXT_HPP

#include <map>
#include <string>

#include "geomancy/score.hpp"

namespace geomancy::config {

using BiasMap = std::map<std::string, double>;

/// Named weight map over indicator keys plus slope/TPI targets.
struct Profile {
  std::string label;
  std::map<std::string, double> weights;
  GaussianTarget slope{8.0, 10.0};  ///< [deg]
  GaussianTarget tpi{0.0, 0.4};
};

/// Cultural tradition parameters.
struct Culture {
  double aspect_target_north = 180.0;  ///< Preferred facing [deg]
  double aspect_target_south = 0.0;
  double aspect_sharpness = 1.0;       ///< Exponent on the cosine score
  double water_distance_target = 220.0;  ///< [m]
  double water_distance_sigma = 350.0;   ///< [m]
  double macro_radius_multiplier = 1.0;
  double micro_radius_multiplier = 1.0;
  double candidate_threshold = 0.62;
  BiasMap weight_bias;   ///< Added to profile weights
  BiasMap term_bias;     ///< Added to landmark scores
  double term_target_shift = 0.0;
};

/// Historical period adjustments applied on top of a culture.
struct Period {
  double water_target_shift = 0.0;
  double water_sigma_shift = 0.0;
  double macro_radius_multiplier = 1.0;
  double micro_radius_multiplier = 1.0;
  double threshold_shift = 0.0;
  BiasMap weight_bias;
  double term_target_shift = 0.0;
};

constexpr auto kDefaultProfile = "general";
constexpr auto kDefaultCulture = "east_asia";
constexpr auto kDefaultPeriod = "early_modern";

std::map<std::string, Profile> defaultProfiles();
std::map<std::string, Culture> defaultCultures();
std::map<std::string, Period> defaultPeriods();

/// Profile used when the catalog is empty.
Profile fallbackProfile();

}  // namespace geomancy::config

#endif  // GEOMANCY_CONFIG_CONTEXT_HPP
