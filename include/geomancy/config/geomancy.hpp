// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONFIG_GEOMANCY_HPP
#define GEOMANCY_CONFIG_GEOMANCY_HPP

#include <map>
#include <string>

namespace YAML {
class Node;
}

#include "geomancy/config/context.hpp"
#include "geomancy/config/network.hpp"
#include "geomancy/config/sampling.hpp"
#include "geomancy/config/terms.hpp"

namespace geomancy {

/// Engine configuration. Defaults reproduce the built-in model, so a
/// default-constructed Config is complete.
struct Config {
  config::Sampling sampling;
  config::TerrainMetrics terrain_metrics;
  config::CandidateSearch candidate_search;
  config::Terms terms;
  config::Links links;
  config::Drainage drainage;
  config::Ridge ridge;
  std::map<std::string, config::Profile> profiles = config::defaultProfiles();
  std::map<std::string, config::Culture> cultures = config::defaultCultures();
  std::map<std::string, config::Period> periods = config::defaultPeriods();

  /// Profile by key: falls back to "general", then the first entry, then
  /// the built-in fallback profile.
  const config::Profile& profile(const std::string& key) const;
};

/// Parse a YAML tree; absent keys keep their defaults.
/// @throws std::invalid_argument on inconsistent values
Config parseConfig(const YAML::Node& root);

/// @throws std::runtime_error if the file cannot be read or parsed
Config loadConfig(const std::string& path);

}  // namespace geomancy

#endif  // GEOMANCY_CONFIG_GEOMANCY_HPP
