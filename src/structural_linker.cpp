// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/terms/structural_linker.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "geomancy/orientation.hpp"

namespace geomancy {

Polyline linkPath(const Point2& origin, const Point2& destination,
                  const std::optional<Point2>& center, double bend_ratio) {
  if (!center) return {origin, destination};
  const Point2 mid = 0.5 * (origin + destination);
  const Point2 control = mid + (*center - mid) * bend_ratio;
  return {origin, control, destination};
}

LinkLayer StructuralLinker::link(const LandmarkLayer& landmarks) const {
  using Group = std::map<std::string, const LandmarkRecord*>;
  std::vector<std::pair<int, Group>> groups;
  std::map<int, size_t> group_index;
  for (const auto& rec : landmarks) {
    if (rec.term_id.empty()) continue;
    auto [it, inserted] = group_index.emplace(rec.parent_id, groups.size());
    if (inserted) groups.emplace_back(rec.parent_id, Group{});
    groups[it->second].second[rec.term_id] = &rec;
  }

  LinkLayer layer("structural_links");
  std::set<std::tuple<int, std::string, std::string, std::string>> seen;

  for (const auto& [parent_id, terms] : groups) {
    std::optional<Point2> center;
    if (links_.curved) {
      auto core = terms.find(term::core);
      if (core != terms.end()) center = core->second->point;
    }

    for (const auto& spec : links_.plan) {
      auto src_it = terms.find(spec.source);
      auto dst_it = terms.find(spec.destination);
      if (src_it == terms.end() || dst_it == terms.end()) continue;
      const LandmarkRecord& src = *src_it->second;
      const LandmarkRecord& dst = *dst_it->second;

      const auto [lo, hi] = std::minmax(spec.source, spec.destination);
      if (!seen.emplace(parent_id, lo, hi, spec.style).second) continue;

      if (src.point == dst.point) continue;
      const Score score = meanOfPresent({src.score, dst.score});
      if (score && *score < links_.min_score) continue;

      StructuralEdgeRecord edge;
      edge.style_term = spec.style;
      edge.style_name = terms_.name(spec.style);
      edge.parent_id = parent_id;
      edge.rank = src.rank;
      edge.score = score;
      edge.culture = src.culture.empty() ? dst.culture : src.culture;
      edge.period = src.period.empty() ? dst.period : src.period;
      edge.src_id = spec.source;
      edge.dst_id = spec.destination;
      edge.length_m = (dst.point - src.point).norm();
      edge.azimuth = azimuthBetween(src.point, dst.point);
      edge.path = linkPath(src.point, dst.point, center, links_.bend_ratio);
      edge.curved = edge.path.size() == 3;
      edge.reason = fmt::format(
          "Structural link {} -> {}. style={}, shape={}, mean score={}, "
          "distance={:.1f}m, azimuth={:.1f}deg ({}).",
          terms_.name(spec.source), terms_.name(spec.destination),
          edge.style_name, edge.curved ? "bent" : "straight",
          formatScore(score), edge.length_m, edge.azimuth,
          compassLabel(edge.azimuth));
      layer.append(std::move(edge));
    }
  }
  return layer;
}

}  // namespace geomancy
