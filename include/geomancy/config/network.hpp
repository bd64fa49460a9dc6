// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONFIG_NETWORK_HPP
#define GEOMANCY_CONFIG_NETWORK_HPP

namespace geomancy::config {

/// Steepest-descent drainage extraction.
struct Drainage {
  double spacing_factor = 3.2;   ///< Min spacing = step x factor
  double coarse_ratio = 0.58;    ///< Min spacing = candidate spacing x ratio
  int max_cells = 26000;
  int min_nodes = 9;             ///< Fewer valid nodes -> empty layer
  double min_drop = 0.15;        ///< Downstream drop floor [m]
  double min_drop_ratio = 0.0012;  ///< Drop also >= elevation range x ratio
  double min_accumulation = 8.0;   ///< Accumulation cutoff floor
  double soft_keep_ratio = 0.82;   ///< Near-miss edges kept above cutoff x ratio
  double path_length_factor = 4.0;        ///< Min path length = spacing x factor
  double path_length_diagonal = 0.006;    ///< ... or extent diagonal x ratio
};

/// Prominence-based ridge extraction.
struct Ridge {
  double spacing_factor = 4.0;
  double coarse_ratio = 0.70;
  int max_cells = 22000;
  int min_nodes = 9;
  int min_neighbors = 4;             ///< Present 8-neighbours required to test a node
  double prominence_floor = 0.6;     ///< [m]
  double prominence_ratio = 0.010;   ///< Floor also >= range x ratio
  double neighbor_delta = 0.05;      ///< [m]
  double neighbor_delta_ratio = 0.0022;
  double majority_ratio = 0.55;      ///< Hard rule: higher-count share
  double soft_majority_ratio = 0.45;
  double soft_prominence_ratio = 0.78;
  double link_distance_factor = 2.9;  ///< Max link distance = spacing x factor
  double link_drop = 2.0;             ///< [m]
  double link_drop_ratio = 0.14;
  double bridge_distance_factor = 3.6;
  double bridge_drop = 2.0;           ///< [m]
  double bridge_drop_ratio = 0.16;
  int max_bridge_endpoints = 1800;    ///< Skip bridging above this count
  double rank_length_weight = 0.62;   ///< Strength weight is 1 - this
};

}  // namespace geomancy::config

#endif  // GEOMANCY_CONFIG_NETWORK_HPP
