// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * drainage_network.hpp
 *
 * Steepest-descent flow graph, accumulation, stream order and traced
 * drainage lines over a GridLattice.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_NETWORK_DRAINAGE_NETWORK_HPP
#define GEOMANCY_NETWORK_DRAINAGE_NETWORK_HPP

#include <vector>

#include "geomancy/config/geomancy.hpp"
#include "geomancy/layers.hpp"
#include "geomancy/network/grid_lattice.hpp"

namespace geomancy {

/// Per-key flow attributes. Absent keys keep their defaults.
struct FlowGraph {
  std::vector<int> downstream;      ///< Lowest qualifying neighbour or kNone
  std::vector<int> upstream_count;  ///< Number of nodes draining here
  std::vector<double> accumulation;  ///< 1 + accumulation of all inflows
  std::vector<int> order;            ///< Strahler-style stream order
  double min_drop = 0.0;
  size_t edge_count = 0;

  bool hasDownstream(int key) const {
    return downstream[key] != GridLattice::kNone;
  }
};

/// Downstream pointers, accumulation in descending-elevation order and
/// stream order from a sweep seeded at nodes without inflow.
FlowGraph buildFlowGraph(const GridLattice& lattice,
                         const config::Drainage& cfg);

/// Accumulation quantile used as the keep cutoff (denser grids keep less).
double keepQuantile(size_t node_count);

/// Stream order that keeps an edge on its own.
int minStreamOrder(size_t node_count);

/// Shortest low-order path kept in the output [m].
double minPathLength(const Extent& extent, double spacing, size_t node_count,
                     const config::Drainage& cfg);

/// "main", "secondary", "branch" or "minor" by maximum order.
const char* streamClass(int order);

class DrainageNetworkBuilder {
 public:
  DrainageNetworkBuilder(const ElevationSource& source, const Config& cfg);

  /// max(step x factor, candidate spacing x ratio), capped by cell count.
  double spacing() const;

  /// @throws OperationCancelled
  DrainageLayer build(const CancellationToken& token = {}) const;

  /// Build on an already sampled lattice.
  /// @throws OperationCancelled
  DrainageLayer build(const GridLattice& lattice,
                      const CancellationToken& token = {}) const;

 private:
  const ElevationSource& source_;
  config::Drainage cfg_;
  config::CandidateSearch candidate_cfg_;
};

}  // namespace geomancy

#endif  // GEOMANCY_NETWORK_DRAINAGE_NETWORK_HPP
