// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/network/drainage_network.hpp"

#include <algorithm>
#include <cmath>
#include <deque>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "geomancy/search/candidate_search.hpp"

namespace geomancy {

namespace {

constexpr int kNeighborOffsets[8][2] = {{-1, -1}, {-1, 0}, {-1, 1}, {0, -1},
                                        {0, 1},   {1, -1}, {1, 0},  {1, 1}};
constexpr size_t kSeedBatch = 64;

/**
 * Follows selected downstream edges from a start node. A trace stops after
 * entering a node that does not have exactly one selected inflow, or at an
 * edge another trace already took. Each node has one downstream edge, so
 * the visited set is indexed by source key.
 */
class DownstreamTracer {
 public:
  DownstreamTracer(const std::vector<int>& selected,
                   const std::vector<int>& upstream_selected)
      : selected_(selected),
        upstream_selected_(upstream_selected),
        visited_(selected.size(), 0) {}

  std::vector<int> trace(int start) {
    std::vector<int> path;
    if (selected_[start] == GridLattice::kNone) return path;
    path.push_back(start);
    int current = start;
    while (selected_[current] != GridLattice::kNone) {
      const int target = selected_[current];
      if (visited_[current]) break;
      visited_[current] = 1;
      path.push_back(target);
      if (upstream_selected_[target] != 1) break;
      current = target;
    }
    if (path.size() < 2) path.clear();
    return path;
  }

 private:
  const std::vector<int>& selected_;
  const std::vector<int>& upstream_selected_;
  std::vector<uint8_t> visited_;
};

}  // namespace

FlowGraph buildFlowGraph(const GridLattice& lattice,
                         const config::Drainage& cfg) {
  const int n = lattice.size();
  FlowGraph g;
  g.downstream.assign(n, GridLattice::kNone);
  g.upstream_count.assign(n, 0);
  g.accumulation.assign(n, 1.0);
  g.order.assign(n, 1);

  const double range =
      std::max(1e-6, lattice.maxElevation() - lattice.minElevation());
  g.min_drop = std::max(cfg.min_drop, range * cfg.min_drop_ratio);

  for (int key : lattice.nodes()) {
    const double z = lattice.elevation(key);
    int best = GridLattice::kNone;
    double best_z = 0.0;
    for (const auto& off : kNeighborOffsets) {
      const int nb = lattice.neighbor(key, off[0], off[1]);
      if (nb == GridLattice::kNone) continue;
      const double nz = lattice.elevation(nb);
      if (nz >= z - g.min_drop) continue;
      if (best == GridLattice::kNone || nz < best_z) {
        best = nb;
        best_z = nz;
      }
    }
    if (best == GridLattice::kNone) continue;
    g.downstream[key] = best;
    ++g.upstream_count[best];
    ++g.edge_count;
  }

  auto by_elevation_desc = [&](int a, int b) {
    return lattice.elevation(a) > lattice.elevation(b);
  };

  // Targets are strictly lower, so a node is final before it propagates
  std::vector<int> keys = lattice.nodes();
  std::stable_sort(keys.begin(), keys.end(), by_elevation_desc);
  for (int key : keys) {
    const int target = g.downstream[key];
    if (target != GridLattice::kNone) g.accumulation[target] += g.accumulation[key];
  }

  // Stream order: sweep from nodes without inflow
  std::vector<int> pending = g.upstream_count;
  std::vector<int> incoming_max(n, 0);
  std::vector<int> incoming_ties(n, 0);
  std::deque<int> queue;
  for (int key : lattice.nodes()) {
    if (pending[key] == 0) queue.push_back(key);
  }
  std::stable_sort(queue.begin(), queue.end(), by_elevation_desc);

  while (!queue.empty()) {
    const int key = queue.front();
    queue.pop_front();
    if (incoming_max[key] == 0) {
      g.order[key] = 1;
    } else {
      g.order[key] = incoming_max[key] + (incoming_ties[key] >= 2 ? 1 : 0);
    }
    const int target = g.downstream[key];
    if (target == GridLattice::kNone) continue;
    const int o = g.order[key];
    if (o > incoming_max[target]) {
      incoming_max[target] = o;
      incoming_ties[target] = 1;
    } else if (o == incoming_max[target]) {
      ++incoming_ties[target];
    }
    if (--pending[target] == 0) queue.push_back(target);
  }
  return g;
}

double keepQuantile(size_t node_count) {
  if (node_count >= 20000) return 0.95;
  if (node_count >= 12000) return 0.93;
  if (node_count >= 7000) return 0.91;
  if (node_count >= 3000) return 0.89;
  return 0.86;
}

int minStreamOrder(size_t node_count) {
  if (node_count >= 18000) return 4;
  if (node_count >= 4000) return 3;
  return 2;
}

double minPathLength(const Extent& extent, double spacing, size_t node_count,
                     const config::Drainage& cfg) {
  double length = std::max(spacing * cfg.path_length_factor,
                           extent.diagonal() * cfg.path_length_diagonal);
  if (node_count >= 18000) {
    length = std::max(length, spacing * 10.0);
  } else if (node_count >= 9000) {
    length = std::max(length, spacing * 7.0);
  } else if (node_count >= 4000) {
    length = std::max(length, spacing * 5.5);
  }
  return length;
}

const char* streamClass(int order) {
  if (order >= 6) return "main";
  if (order >= 5) return "secondary";
  if (order >= 4) return "branch";
  return "minor";
}

// ─── Builder ────────────────────────────────────────────────────────────────

DrainageNetworkBuilder::DrainageNetworkBuilder(const ElevationSource& source,
                                               const Config& cfg)
    : source_(source), cfg_(cfg.drainage), candidate_cfg_(cfg.candidate_search) {}

double DrainageNetworkBuilder::spacing() const {
  const double step = source_.step();
  const Extent extent = source_.extent();
  const double coarse = adaptiveSpacing(extent, step, candidate_cfg_);
  double s = std::max(step * cfg_.spacing_factor, coarse * cfg_.coarse_ratio);
  if (!(s > 0.0)) s = std::max(step * cfg_.spacing_factor, 1.0);
  return cappedSpacing(extent, s, cfg_.max_cells);
}

DrainageLayer DrainageNetworkBuilder::build(
    const CancellationToken& token) const {
  const double s = spacing();
  spdlog::debug("[Drainage] Sampling lattice at {:.2f} m", s);
  return build(GridLattice::sample(source_, s, token), token);
}

DrainageLayer DrainageNetworkBuilder::build(
    const GridLattice& lattice, const CancellationToken& token) const {
  DrainageLayer layer("drainage");
  if (lattice.cols() < 2 || lattice.rows() < 2) {
    spdlog::warn("[Drainage] Lattice {}x{} too small", lattice.cols(),
                 lattice.rows());
    return layer;
  }
  const size_t node_count = lattice.nodeCount();
  if (node_count < static_cast<size_t>(std::max(1, cfg_.min_nodes))) {
    spdlog::warn("[Drainage] Only {} valid nodes, skipping", node_count);
    return layer;
  }

  token.throwIfCancelled("flow graph");
  const FlowGraph g = buildFlowGraph(lattice, cfg_);
  if (g.edge_count == 0) return layer;

  std::vector<double> acc_values;
  acc_values.reserve(g.edge_count);
  for (int key : lattice.nodes()) {
    if (g.hasDownstream(key)) acc_values.push_back(g.accumulation[key]);
  }
  std::sort(acc_values.begin(), acc_values.end());

  const double quantile = keepQuantile(node_count);
  const int min_order = minStreamOrder(node_count);
  const double min_length =
      minPathLength(lattice.extent(), lattice.spacing(), node_count, cfg_);
  int cut = static_cast<int>(acc_values.size() * quantile);
  cut = std::clamp(cut, 0, static_cast<int>(acc_values.size()) - 1);
  const double threshold = std::max(cfg_.min_accumulation, acc_values[cut]);
  const int soft_order = std::max(2, min_order - 1);

  std::vector<int> selected(lattice.size(), GridLattice::kNone);
  std::vector<int> upstream_selected(lattice.size(), 0);
  std::vector<int> selected_keys;
  for (int key : lattice.nodes()) {
    if (!g.hasDownstream(key)) continue;
    const double acc = g.accumulation[key];
    const int order = g.order[key];
    const bool keep =
        acc >= threshold || order >= min_order ||
        (order >= soft_order && acc >= threshold * cfg_.soft_keep_ratio);
    if (!keep) continue;
    selected[key] = g.downstream[key];
    ++upstream_selected[g.downstream[key]];
    selected_keys.push_back(key);
  }
  if (selected_keys.empty()) return layer;

  std::vector<int> heads;
  for (int key : selected_keys) {
    if (upstream_selected[key] != 1) heads.push_back(key);
  }
  std::stable_sort(heads.begin(), heads.end(), [&](int a, int b) {
    if (g.order[a] != g.order[b]) return g.order[a] > g.order[b];
    return g.accumulation[a] > g.accumulation[b];
  });

  DownstreamTracer tracer(selected, upstream_selected);
  std::vector<std::vector<int>> paths;
  auto run = [&](const std::vector<int>& seeds, const char* where) {
    for (size_t i = 0; i < seeds.size(); ++i) {
      if (i % kSeedBatch == 0) token.throwIfCancelled(where);
      auto path = tracer.trace(seeds[i]);
      if (!path.empty()) paths.push_back(std::move(path));
    }
  };
  run(heads, "drainage tracing");
  run(selected_keys, "drainage sweep");

  int stream_id = 1;
  for (auto& path : paths) {
    DrainagePathRecord rec;
    rec.points.reserve(path.size());
    for (int key : path) rec.points.push_back(lattice.point(key));
    rec.length = polylineLength(rec.points);
    if (rec.length <= 0.0) continue;

    double max_acc = 0.0;
    int max_order = 0;
    for (int key : path) {
      max_acc = std::max(max_acc, g.accumulation[key]);
      max_order = std::max(max_order, g.order[key]);
    }
    if (rec.length < min_length && max_order < min_order) continue;

    rec.stream_id = stream_id++;
    rec.flow_acc = max_acc;
    rec.acc_threshold = threshold;
    rec.keep_quantile = quantile;
    rec.min_length = min_length;
    rec.min_order = min_order;
    rec.node_count = static_cast<int>(node_count);
    rec.order = max_order;
    rec.stream_class = streamClass(max_order);
    rec.nodes = std::move(path);
    rec.reason = fmt::format(
        "Steepest-descent stream. flow_acc={:.2f}, cutoff={:.2f}, "
        "keep quantile={:.1f}%, order={} (min {}), length={:.1f}m "
        "(min {:.1f}m), class={}.",
        max_acc, threshold, quantile * 100.0, max_order, min_order,
        rec.length, min_length, rec.stream_class);
    layer.append(std::move(rec));
  }

  spdlog::info("[Drainage] {} nodes, cutoff {:.2f}, {} streams", node_count,
                threshold, layer.size());
  return layer;
}

}  // namespace geomancy
