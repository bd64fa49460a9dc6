// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ridge_network.hpp
 *
 * Prominence-based ridge detection, linking, endpoint bridging, tracing
 * and ranking over a GridLattice.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_NETWORK_RIDGE_NETWORK_HPP
#define GEOMANCY_NETWORK_RIDGE_NETWORK_HPP

#include <map>
#include <set>
#include <utility>
#include <vector>

#include "geomancy/config/geomancy.hpp"
#include "geomancy/layers.hpp"
#include "geomancy/network/grid_lattice.hpp"

namespace geomancy {

/// Ridge-flagged lattice nodes.
struct RidgeNodes {
  std::vector<uint8_t> flag;      ///< Per lattice key
  std::vector<double> strength;   ///< Per lattice key, in [0, 1]
  std::vector<int> keys;          ///< Flagged keys, ascending
  double prominence_min = 0.0;
  double neighbor_delta = 0.0;

  bool contains(int key) const { return key >= 0 && flag[key] != 0; }
};

/// Ridge node key -> linked ridge node keys, both ascending.
using RidgeAdjacency = std::map<int, std::set<int>>;

/// Flags nodes that stand above most of their present 8-neighbours or
/// above their mean by the prominence floor (hard or relaxed rule).
RidgeNodes detectRidgeNodes(const GridLattice& lattice,
                            const config::Ridge& cfg);

/// Unflags ridge nodes with no ridge 8-neighbour.
void dropIsolatedRidgeNodes(const GridLattice& lattice, RidgeNodes& nodes);

/// Links ridge nodes within the offset stencil under the distance and
/// elevation-difference limits.
RidgeAdjacency linkRidgeNodes(const GridLattice& lattice,
                              const RidgeNodes& nodes,
                              const config::Ridge& cfg);

/// Connects pairs of degree-1 endpoints by lowest cost. Each endpoint is
/// bridged at most once. Returns the number of added edges.
int bridgeEndpoints(RidgeAdjacency& adjacency, const GridLattice& lattice,
                    const RidgeNodes& nodes, const config::Ridge& cfg);

/**
 * @brief Splits the ridge graph into chains between branch nodes.
 *
 * Traces start at nodes whose degree is not 2, then a sweep over every
 * node picks up cycles. Seeds and neighbours are visited in key order
 * and each undirected edge is traced once.
 */
class RidgeTracer {
 public:
  explicit RidgeTracer(const RidgeAdjacency& adjacency)
      : adjacency_(adjacency) {}

  /// @throws OperationCancelled
  std::vector<std::vector<int>> trace(const CancellationToken& token = {});

 private:
  std::vector<int> traceFrom(int start, int neighbor);

  const RidgeAdjacency& adjacency_;
  std::set<std::pair<int, int>> visited_;
};

/// "daegan", "jeongmaek", "gimaek" or "jimaek" by rank percentile.
const char* ridgeClass(double percentile);

/// Scores by length share and strength, sorts descending (stable) and
/// assigns id, rank and class. Paths need `length` and `strength` set.
void rankRidgePaths(std::vector<RidgePathRecord>& paths,
                    double length_weight);

class RidgeNetworkBuilder {
 public:
  RidgeNetworkBuilder(const ElevationSource& source, const Config& cfg);

  /// max(step x factor, candidate spacing x ratio), capped by cell count.
  double spacing() const;

  /// @throws OperationCancelled
  RidgeLayer build(const CancellationToken& token = {}) const;

  /// @throws OperationCancelled
  RidgeLayer build(const GridLattice& lattice,
                   const CancellationToken& token = {}) const;

 private:
  const ElevationSource& source_;
  config::Ridge cfg_;
  config::CandidateSearch candidate_cfg_;
};

}  // namespace geomancy

#endif  // GEOMANCY_NETWORK_RIDGE_NETWORK_HPP
