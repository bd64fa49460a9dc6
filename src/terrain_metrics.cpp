// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/analysis/terrain_metrics.hpp"

#include <algorithm>
#include <cmath>

namespace geomancy {

namespace {
constexpr double kConvergenceEps = 1e-6;
}  // namespace

TerrainMetricEngine::TerrainMetricEngine(const ElevationSource& source,
                                         const config::Sampling& sampling,
                                         const config::TerrainMetrics& metrics)
    : sampler_(source),
      sampling_(sampling),
      metrics_(metrics),
      step_(source.step()),
      macro_bearings_(ringBearings(sampling.macro_bearing_step)),
      micro_bearings_(ringBearings(sampling.micro_bearing_step)) {}

double TerrainMetricEngine::microRadius(const CulturalContext& ctx) const {
  return step_ * sampling_.micro_radius_factor * ctx.micro_radius_multiplier;
}

double TerrainMetricEngine::macroRadius(const CulturalContext& ctx) const {
  return step_ * sampling_.macro_radius_factor * ctx.macro_radius_multiplier;
}

TerrainMetrics TerrainMetricEngine::compute(const Point2& site,
                                            const Score& slope_deg,
                                            const CulturalContext& ctx) const {
  TerrainMetrics out;
  out.center = sampler_.sample(site);
  if (!out.center) return out;
  const double center = *out.center;

  const double micro_radius = microRadius(ctx);
  const double macro_radius = macroRadius(ctx);
  const auto macro = sampler_.ring(site, macro_radius, macro_bearings_);
  const auto micro = sampler_.ring(site, micro_radius, micro_bearings_);

  Score mean_macro;
  Score std_macro;
  Score std_micro;
  if (!macro.empty()) {
    const auto [lo, hi] = std::minmax_element(macro.begin(), macro.end());
    out.relief = *hi - *lo;
    mean_macro = mean(macro);
    std_macro = stddev(macro);
  }
  std_micro = stddev(micro);

  const bool has_relief = out.relief && *out.relief > 0.0;

  // Form: back rises, front falls, flanks balanced
  const Cardinals card = cardinalsFor(ctx.hemisphere);
  const Score back = sampler_.directionalMean(site, macro_radius, card.back);
  const Score front = sampler_.directionalMean(site, macro_radius, card.front);
  const Score left = sampler_.directionalMean(site, macro_radius, card.left);
  const Score right = sampler_.directionalMean(site, macro_radius, card.right);
  if (has_relief && back && front && left && right) {
    const double relief = *out.relief;
    const double back_norm = (*back - center) / relief;
    const double front_norm = (center - *front) / relief;
    const double side_norm = (*left - *right) / relief;
    out.form_score = meanOfPresent({gaussianScore(back_norm, metrics_.form_back),
                                    gaussianScore(front_norm, metrics_.form_front),
                                    gaussianScore(side_norm, metrics_.form_side)});
  }

  // Longitudinal: TPI shape and micro/macro variability ratio
  if (has_relief && mean_macro) {
    out.tpi = (center - *mean_macro) / *out.relief;
    Score hierarchy;
    if (std_micro && std_macro && *std_macro > 0.0) {
      hierarchy = *std_micro / *std_macro;
    }
    out.long_score = meanOfPresent({gaussianScore(out.tpi, metrics_.tpi_shape),
                                    gaussianScore(hierarchy, metrics_.hierarchy)});
  }

  // Convergence / wetness
  if (!micro.empty()) {
    double higher = 0.0;
    double lower = 0.0;
    for (double v : micro) {
      higher += std::max(v - center, 0.0);
      lower += std::max(center - v, 0.0);
    }
    out.convergence = higher / (higher + lower + kConvergenceEps);

    double slope_factor = metrics_.unknown_slope_factor;
    if (slope_deg) {
      slope_factor = std::max(
          metrics_.min_slope_factor,
          1.0 - std::min(1.0, *slope_deg / metrics_.slope_denominator));
    }
    const double shape = gaussianScore(*out.convergence, metrics_.wetness);
    out.wetness = std::clamp(shape * (0.6 + 0.4 * slope_factor), 0.0, 1.0);
  }

  return out;
}

}  // namespace geomancy
