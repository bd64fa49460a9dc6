// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/network/ridge_network.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "geomancy/search/candidate_search.hpp"

namespace geomancy {

namespace {

constexpr int kNeighborhood[8][2] = {{-1, -1}, {-1, 0}, {-1, 1}, {0, -1},
                                     {0, 1},   {1, -1}, {1, 0},  {1, 1}};

// Forward half of a 5x5 stencil
constexpr int kSegmentOffsets[12][2] = {{1, 0},  {0, 1},  {1, 1},  {1, -1},
                                        {2, 0},  {0, 2},  {2, 1},  {1, 2},
                                        {2, -1}, {1, -2}, {2, 2},  {2, -2}};

constexpr size_t kSeedBatch = 64;

double elevationRange(const GridLattice& lattice) {
  return std::max(1e-6, lattice.maxElevation() - lattice.minElevation());
}

std::pair<int, int> edgeKey(int a, int b) {
  return a <= b ? std::make_pair(a, b) : std::make_pair(b, a);
}

}  // namespace

RidgeNodes detectRidgeNodes(const GridLattice& lattice,
                            const config::Ridge& cfg) {
  RidgeNodes out;
  out.flag.assign(lattice.size(), 0);
  out.strength.assign(lattice.size(), 0.0);

  const double range = elevationRange(lattice);
  out.prominence_min = std::max(cfg.prominence_floor, range * cfg.prominence_ratio);
  out.neighbor_delta = std::max(cfg.neighbor_delta, range * cfg.neighbor_delta_ratio);
  const double pmin = out.prominence_min;

  for (int key : lattice.nodes()) {
    const double z = lattice.elevation(key);
    int n = 0;
    int higher = 0;
    double sum = 0.0;
    for (const auto& off : kNeighborhood) {
      const int nb = lattice.neighbor(key, off[0], off[1]);
      if (nb == GridLattice::kNone) continue;
      const double nz = lattice.elevation(nb);
      ++n;
      sum += nz;
      if (z >= nz + out.neighbor_delta) ++higher;
    }
    if (n < cfg.min_neighbors) continue;

    const double prominence = z - sum / n;
    const int required = std::max(3, static_cast<int>(n * cfg.majority_ratio));
    const int soft_required =
        std::max(2, static_cast<int>(n * cfg.soft_majority_ratio));
    const bool hard = higher >= required && prominence >= pmin;
    const bool soft = higher >= soft_required &&
                      prominence >= pmin * cfg.soft_prominence_ratio;
    if (!hard && !soft) continue;

    const double prominence_norm = std::min(1.0, prominence / (pmin * 2.0));
    const double local_ratio = static_cast<double>(higher) / n;
    out.flag[key] = 1;
    out.strength[key] = 0.45 * local_ratio + 0.55 * prominence_norm;
    out.keys.push_back(key);
  }
  return out;
}

void dropIsolatedRidgeNodes(const GridLattice& lattice, RidgeNodes& nodes) {
  std::vector<int> kept;
  std::vector<int> dropped;
  for (int key : nodes.keys) {
    bool linked = false;
    for (const auto& off : kNeighborhood) {
      if (nodes.contains(lattice.neighbor(key, off[0], off[1]))) {
        linked = true;
        break;
      }
    }
    (linked ? kept : dropped).push_back(key);
  }
  // Decide against the unfiltered set first, then unflag
  for (int key : dropped) {
    nodes.flag[key] = 0;
    nodes.strength[key] = 0.0;
  }
  nodes.keys = std::move(kept);
}

RidgeAdjacency linkRidgeNodes(const GridLattice& lattice,
                              const RidgeNodes& nodes,
                              const config::Ridge& cfg) {
  const double max_distance = lattice.spacing() * cfg.link_distance_factor;
  const double max_drop =
      std::max(cfg.link_drop, elevationRange(lattice) * cfg.link_drop_ratio);

  RidgeAdjacency adjacency;
  for (int key : nodes.keys) adjacency[key];
  for (int a : nodes.keys) {
    for (const auto& off : kSegmentOffsets) {
      const int b = lattice.neighbor(a, off[0], off[1]);
      if (!nodes.contains(b)) continue;
      if ((lattice.point(b) - lattice.point(a)).norm() > max_distance) continue;
      if (std::abs(lattice.elevation(a) - lattice.elevation(b)) > max_drop) {
        continue;
      }
      adjacency[a].insert(b);
      adjacency[b].insert(a);
    }
  }
  return adjacency;
}

int bridgeEndpoints(RidgeAdjacency& adjacency, const GridLattice& lattice,
                    const RidgeNodes& nodes, const config::Ridge& cfg) {
  std::vector<int> endpoints;
  for (const auto& [key, nbs] : adjacency) {
    if (nbs.size() == 1) endpoints.push_back(key);
  }
  if (endpoints.size() < 2) return 0;
  if (endpoints.size() > static_cast<size_t>(cfg.max_bridge_endpoints)) {
    spdlog::debug("[Ridge] {} endpoints, bridging skipped", endpoints.size());
    return 0;
  }

  const double max_distance = lattice.spacing() * cfg.bridge_distance_factor;
  const double max_distance_sq = max_distance * max_distance;
  const double tolerance =
      std::max(cfg.bridge_drop, elevationRange(lattice) * cfg.bridge_drop_ratio);

  std::set<int> used;
  int bridged = 0;
  for (int key : endpoints) {
    if (used.count(key)) continue;
    const Point2 p = lattice.point(key);
    const double z = lattice.elevation(key);
    const double strength = nodes.strength[key];

    int best = GridLattice::kNone;
    double best_cost = 0.0;
    for (int other : endpoints) {
      if (other == key || used.count(other)) continue;
      if (adjacency[key].count(other)) continue;
      const double dz = std::abs(z - lattice.elevation(other));
      if (dz > tolerance) continue;
      const double d_sq = (p - lattice.point(other)).squaredNorm();
      if (d_sq > max_distance_sq) continue;
      const double cost = 0.55 * std::sqrt(d_sq) / max_distance +
                          0.25 * dz / tolerance +
                          0.20 * std::abs(strength - nodes.strength[other]);
      if (best == GridLattice::kNone || cost < best_cost) {
        best = other;
        best_cost = cost;
      }
    }
    if (best == GridLattice::kNone) continue;
    adjacency[key].insert(best);
    adjacency[best].insert(key);
    used.insert(key);
    used.insert(best);
    ++bridged;
  }
  return bridged;
}

// ─── Tracing ────────────────────────────────────────────────────────────────

std::vector<int> RidgeTracer::traceFrom(int start, int neighbor) {
  if (!visited_.insert(edgeKey(start, neighbor)).second) return {};

  std::vector<int> path{start, neighbor};
  int prev = start;
  int current = neighbor;
  while (true) {
    const auto& nbs = adjacency_.at(current);
    int next = GridLattice::kNone;
    int candidates = 0;
    for (int nb : nbs) {
      if (nb == prev) continue;
      next = nb;
      ++candidates;
    }
    if (candidates != 1) break;
    if (!visited_.insert(edgeKey(current, next)).second) break;
    path.push_back(next);
    prev = current;
    current = next;
  }
  return path;
}

std::vector<std::vector<int>> RidgeTracer::trace(
    const CancellationToken& token) {
  std::vector<std::vector<int>> paths;
  auto expand = [&](int seed) {
    for (int nb : adjacency_.at(seed)) {
      auto path = traceFrom(seed, nb);
      if (path.size() > 1) paths.push_back(std::move(path));
    }
  };

  std::vector<int> branches;
  for (const auto& [key, nbs] : adjacency_) {
    if (!nbs.empty() && nbs.size() != 2) branches.push_back(key);
  }
  for (size_t i = 0; i < branches.size(); ++i) {
    if (i % kSeedBatch == 0) token.throwIfCancelled("ridge tracing");
    expand(branches[i]);
  }

  size_t i = 0;
  for (const auto& entry : adjacency_) {
    if (i++ % kSeedBatch == 0) token.throwIfCancelled("ridge sweep");
    expand(entry.first);
  }
  return paths;
}

// ─── Ranking ────────────────────────────────────────────────────────────────

const char* ridgeClass(double percentile) {
  if (percentile <= 0.05) return "daegan";
  if (percentile <= 0.22) return "jeongmaek";
  if (percentile <= 0.52) return "gimaek";
  return "jimaek";
}

void rankRidgePaths(std::vector<RidgePathRecord>& paths,
                    double length_weight) {
  if (paths.empty()) return;
  double max_len = 1e-6;
  for (const auto& p : paths) max_len = std::max(max_len, p.length);
  for (auto& p : paths) {
    p.ridge_score = length_weight * (p.length / max_len) +
                    (1.0 - length_weight) * p.strength;
  }
  std::stable_sort(paths.begin(), paths.end(),
                   [](const RidgePathRecord& a, const RidgePathRecord& b) {
                     return a.ridge_score > b.ridge_score;
                   });
  const double total = static_cast<double>(paths.size());
  int index = 0;
  for (auto& p : paths) {
    ++index;
    p.ridge_id = index;
    p.rank = index;
    p.ridge_class = ridgeClass(index / total);
  }
}

// ─── Builder ────────────────────────────────────────────────────────────────

RidgeNetworkBuilder::RidgeNetworkBuilder(const ElevationSource& source,
                                         const Config& cfg)
    : source_(source), cfg_(cfg.ridge), candidate_cfg_(cfg.candidate_search) {}

double RidgeNetworkBuilder::spacing() const {
  const double step = source_.step();
  const Extent extent = source_.extent();
  const double coarse = adaptiveSpacing(extent, step, candidate_cfg_);
  double s = std::max(step * cfg_.spacing_factor, coarse * cfg_.coarse_ratio);
  if (!(s > 0.0)) s = std::max(step * cfg_.spacing_factor, 1.0);
  return cappedSpacing(extent, s, cfg_.max_cells);
}

RidgeLayer RidgeNetworkBuilder::build(const CancellationToken& token) const {
  const double s = spacing();
  spdlog::debug("[Ridge] Sampling lattice at {:.2f} m", s);
  return build(GridLattice::sample(source_, s, token), token);
}

RidgeLayer RidgeNetworkBuilder::build(const GridLattice& lattice,
                                      const CancellationToken& token) const {
  RidgeLayer layer("ridges");
  if (lattice.cols() < 2 || lattice.rows() < 2 ||
      lattice.nodeCount() < static_cast<size_t>(std::max(1, cfg_.min_nodes))) {
    spdlog::warn("[Ridge] Lattice {}x{} with {} nodes too small",
                 lattice.cols(), lattice.rows(), lattice.nodeCount());
    return layer;
  }

  token.throwIfCancelled("ridge detection");
  RidgeNodes nodes = detectRidgeNodes(lattice, cfg_);
  if (nodes.keys.size() < 2) return layer;
  dropIsolatedRidgeNodes(lattice, nodes);
  if (nodes.keys.size() < 2) return layer;

  RidgeAdjacency adjacency = linkRidgeNodes(lattice, nodes, cfg_);
  const bool linked = std::any_of(adjacency.begin(), adjacency.end(),
                                  [](const auto& e) { return !e.second.empty(); });
  if (!linked) return layer;

  const int bridged = bridgeEndpoints(adjacency, lattice, nodes, cfg_);

  RidgeTracer tracer(adjacency);
  std::vector<RidgePathRecord> paths;
  for (auto& keys : tracer.trace(token)) {
    RidgePathRecord rec;
    double strength_sum = 0.0;
    for (int key : keys) {
      rec.points.push_back(lattice.point(key));
      strength_sum += nodes.strength[key];
    }
    rec.length = polylineLength(rec.points);
    if (rec.length <= 0.0) continue;
    rec.strength = strength_sum / keys.size();
    rec.elev_a = lattice.elevation(keys.front());
    rec.elev_b = lattice.elevation(keys.back());
    rec.nodes = std::move(keys);
    paths.push_back(std::move(rec));
  }
  if (paths.empty()) return layer;

  rankRidgePaths(paths, cfg_.rank_length_weight);

  const double max_distance = lattice.spacing() * cfg_.link_distance_factor;
  const double max_drop =
      std::max(cfg_.link_drop, elevationRange(lattice) * cfg_.link_drop_ratio);
  const size_t total = paths.size();
  for (auto& rec : paths) {
    rec.reason = fmt::format(
        "Ridge score={:.3f} (length and prominence), rank={}/{}, "
        "percentile={:.1f}%, class={}, links: distance<={:.1f}m, "
        "drop<={:.1f}m, bridged={}.",
        rec.ridge_score, rec.rank, total, 100.0 * rec.rank / total,
        rec.ridge_class, max_distance, max_drop, bridged);
    layer.append(std::move(rec));
  }

  spdlog::info("[Ridge] {} ridge nodes, {} bridges, {} paths",
                nodes.keys.size(), bridged, layer.size());
  return layer;
}

}  // namespace geomancy
