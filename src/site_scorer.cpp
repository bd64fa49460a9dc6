// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/scoring/site_scorer.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <tuple>
#include <vector>

#include "geomancy/analysis/surface_derivatives.hpp"

namespace geomancy {

namespace {
constexpr double kNearWaterDistance = 30.0;  // [m]
constexpr double kNearWaterFloor = 0.1;
constexpr double kDistanceShare = 0.7;
}  // namespace

Score Indicators::get(const std::string& key) const {
  if (key == indicator::slope) return slope;
  if (key == indicator::aspect) return aspect;
  if (key == indicator::form) return form;
  if (key == indicator::longitudinal) return longitudinal;
  if (key == indicator::water) return water;
  if (key == indicator::conv) return conv;
  if (key == indicator::tpi) return tpi;
  return std::nullopt;
}

Score scoreAspect(const Score& aspect_deg, const CulturalContext& ctx) {
  if (!aspect_deg) return std::nullopt;
  const double sharpness = std::max(0.5, ctx.aspect_sharpness);
  const double diff =
      std::abs(wrapAzimuth(*aspect_deg - ctx.aspect_target + 180.0) - 180.0);
  const double base = (std::cos(diff * M_PI / 180.0) + 1.0) / 2.0;
  return std::clamp(std::pow(base, sharpness), 0.0, 1.0);
}

Score scoreWaterDistance(const Score& distance_m, const CulturalContext& ctx) {
  if (!distance_m) return std::nullopt;
  const double score = gaussianScore(*distance_m, ctx.water_distance_target,
                                     ctx.water_distance_sigma);
  if (*distance_m < kNearWaterDistance) {
    return std::max(kNearWaterFloor, score * 0.5);
  }
  return score;
}

Score combineHydroScores(const Score& distance_score, const Score& dem_score) {
  if (distance_score && dem_score) {
    return kDistanceShare * *distance_score + (1.0 - kDistanceShare) * *dem_score;
  }
  if (distance_score) return distance_score;
  return dem_score;
}

config::Profile contextualizeProfile(const config::Profile& profile,
                                     const CulturalContext& ctx) {
  config::Profile adjusted = profile;
  for (const auto& [key, delta] : ctx.weight_bias) {
    auto& w = adjusted.weights[key];
    w = std::max(0.0, w + delta);
  }
  double total = 0.0;
  for (const auto& [key, w] : adjusted.weights) total += w;
  if (total > 0.0) {
    for (auto& [key, w] : adjusted.weights) w /= total;
  }
  return adjusted;
}

Score profileWeightedScore(const Indicators& indicators,
                           const config::Profile& profile) {
  std::vector<std::pair<double, Score>> entries;
  entries.reserve(profile.weights.size());
  for (const auto& [key, weight] : profile.weights) {
    entries.emplace_back(weight, indicators.get(key));
  }
  auto value = weightedMean(entries);
  if (!value) return std::nullopt;
  return *value * 100.0;
}

Score profileConfidence(const Indicators& indicators,
                        const config::Profile& profile) {
  double total = 0.0;
  double available = 0.0;
  for (const auto& [key, weight] : profile.weights) {
    total += weight;
    if (indicators.get(key)) available += weight;
  }
  if (total <= 0.0) return std::nullopt;
  return available / total;
}

std::string explainTopFactors(const Indicators& indicators,
                              const config::Profile& profile) {
  std::vector<std::tuple<double, std::string, double>> weighted;
  for (const auto& [key, weight] : profile.weights) {
    if (auto s = indicators.get(key)) {
      weighted.emplace_back(weight * *s, key, *s);
    }
  }
  if (weighted.empty()) return "no-data";
  std::sort(weighted.begin(), weighted.end(), std::greater<>());
  std::string note;
  const size_t top = std::min<size_t>(2, weighted.size());
  for (size_t i = 0; i < top; ++i) {
    if (i > 0) note += ",";
    note += fmt::format("{}:{:.2f}", std::get<1>(weighted[i]),
                        std::get<2>(weighted[i]));
  }
  return note;
}

// ─── SiteScorer ─────────────────────────────────────────────────────────────

SiteScorer::SiteScorer(const ElevationSource& source, const Config& cfg,
                       const std::string& profile_key,
                       const CulturalContext& ctx)
    : source_(source),
      engine_(source, cfg.sampling, cfg.terrain_metrics),
      profile_key_(profile_key),
      profile_(contextualizeProfile(cfg.profile(profile_key), ctx)),
      ctx_(ctx) {}

SiteAssessment SiteScorer::assess(const Point2& site,
                                  const SiteInputs& inputs) const {
  SiteAssessment out;
  out.slope_deg = inputs.slope_deg;
  out.aspect_deg = inputs.aspect_deg;
  if (!out.slope_deg || !out.aspect_deg) {
    const SurfaceGradient g = surfaceDerivatives(source_, site);
    if (!out.slope_deg) out.slope_deg = g.slope_deg;
    if (!out.aspect_deg) out.aspect_deg = g.aspect_deg;
  }

  out.metrics = engine_.compute(site, out.slope_deg, ctx_);
  const TerrainMetrics& m = out.metrics;

  Indicators& ind = out.indicators;
  ind.slope = gaussianScore(out.slope_deg, profile_.slope);
  ind.aspect = scoreAspect(out.aspect_deg, ctx_);
  ind.form = m.form_score;
  ind.longitudinal = m.long_score;
  ind.water = combineHydroScores(
      scoreWaterDistance(inputs.water_distance_m, ctx_), m.wetness);
  ind.conv = m.wetness;
  ind.tpi = gaussianScore(m.tpi, profile_.tpi);

  out.total = profileWeightedScore(ind, profile_);
  out.confidence = profileConfidence(ind, profile_);
  out.note = explainTopFactors(ind, profile_);
  out.reason = fmt::format(
      "model={}, culture={}, period={}, score={}, slope={}, aspect={}, "
      "water_m={}, top={}",
      profile_key_, ctx_.culture_key, ctx_.period_key, formatScore(out.total, 2),
      formatScore(out.slope_deg, 2), formatScore(out.aspect_deg, 1),
      formatScore(inputs.water_distance_m, 1), out.note);
  return out;
}

}  // namespace geomancy
