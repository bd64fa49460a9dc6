// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/search/candidate_search.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace geomancy {

double adaptiveSpacing(const Extent& extent, double step,
                       const config::CandidateSearch& cfg) {
  const double min_span = std::min(extent.width(), extent.height());
  double spacing = std::max(step * cfg.spacing_factor, min_span / cfg.span_divisor);
  if (spacing <= 0.0) return std::max(step * cfg.spacing_factor, 1.0);

  const int cols = std::max(1, static_cast<int>(extent.width() / spacing) + 1);
  const int rows = std::max(1, static_cast<int>(extent.height() / spacing) + 1);
  const double total = static_cast<double>(cols) * rows;
  if (total > cfg.max_cells) {
    spacing *= std::sqrt(total / cfg.max_cells);
  }
  return spacing;
}

int recommendedCandidateCount(const Extent& extent, double spacing) {
  const double s = std::max(spacing, 1e-6);
  const long cols = std::max(1L, static_cast<long>(extent.width() / s));
  const long rows = std::max(1L, static_cast<long>(extent.height() / s));
  const long nodes = cols * rows;
  if (nodes >= 22000) return 2;
  if (nodes >= 12000) return 3;
  if (nodes >= 5000) return 4;
  return 5;
}

std::vector<Candidate> suppressNearDuplicates(
    const std::vector<Candidate>& sorted, double min_distance, int keep) {
  std::vector<Candidate> selected;
  if (keep <= 0) return selected;
  const double min_sq = min_distance * min_distance;
  for (const auto& item : sorted) {
    const bool too_close =
        std::any_of(selected.begin(), selected.end(), [&](const Candidate& s) {
          return (item.point - s.point).squaredNorm() < min_sq;
        });
    if (too_close) continue;
    selected.push_back(item);
    if (static_cast<int>(selected.size()) >= keep) break;
  }
  return selected;
}

// ─── CandidateSearch ────────────────────────────────────────────────────────

CandidateSearch::CandidateSearch(const ElevationSource& source,
                                 const Config& cfg)
    : source_(source),
      cfg_(cfg.candidate_search),
      engine_(source, cfg.sampling, cfg.terrain_metrics) {}

std::vector<Candidate> CandidateSearch::collect(
    const CulturalContext& ctx, double spacing,
    const CancellationToken& token) const {
  const Extent extent = source_.extent();
  std::vector<Candidate> candidates;
  if (!(spacing > 0.0)) return candidates;

  for (double x = extent.x_min + spacing * 0.5; x < extent.x_max; x += spacing) {
    token.throwIfCancelled("candidate search");
    for (double y = extent.y_min + spacing * 0.5; y < extent.y_max;
         y += spacing) {
      const Point2 p(x, y);
      const TerrainMetrics m = engine_.compute(p, std::nullopt, ctx);
      if (!m.center) continue;
      if (m.tpi && (*m.tpi < cfg_.tpi_min || *m.tpi > cfg_.tpi_max)) continue;

      const Score shape = meanOfPresent({m.form_score, m.long_score, m.wetness});
      const Score score = meanOfPresent({shape, gaussianScore(m.tpi, cfg_.tpi)});
      if (!score || *score < ctx.candidate_threshold) continue;

      candidates.push_back({p, *m.center, *score, m});
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& a, const Candidate& b) {
                     return a.score > b.score;
                   });
  return candidates;
}

CandidateSearch::Result CandidateSearch::run(
    const CulturalContext& ctx, int max_candidates,
    const CancellationToken& token) const {
  Result result;
  const Extent extent = source_.extent();
  result.spacing = adaptiveSpacing(extent, engine_.step(), cfg_);
  result.desired = std::max(
      1, std::min(max_candidates, recommendedCandidateCount(extent, result.spacing)));
  result.separation =
      result.spacing *
      (result.desired <= 3 ? cfg_.sparse_separation : cfg_.dense_separation);

  const auto candidates = collect(ctx, result.spacing, token);
  result.passed = candidates.size();
  result.selected =
      suppressNearDuplicates(candidates, result.separation, result.desired);

  spdlog::info(
      "[CandidateSearch] spacing={:.2f}m, {} passed (threshold {:.3f}), "
      "kept {}/{} (separation {:.1f}m)",
      result.spacing, result.passed, ctx.candidate_threshold,
      result.selected.size(), result.desired, result.separation);
  return result;
}

}  // namespace geomancy
