// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * site_scorer.hpp
 *
 * Multi-criteria suitability score of a site under a scoring profile
 * and a cultural/period context.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_SCORING_SITE_SCORER_HPP
#define GEOMANCY_SCORING_SITE_SCORER_HPP

#include <string>

#include "geomancy/analysis/terrain_metrics.hpp"
#include "geomancy/config/geomancy.hpp"
#include "geomancy/context.hpp"

namespace geomancy {

// ─── Indicator keys (profile weight map keys) ───────────────────────────────

namespace indicator {
constexpr auto slope = "slope";
constexpr auto aspect = "aspect";
constexpr auto form = "form";
constexpr auto longitudinal = "long";
constexpr auto water = "water";
constexpr auto conv = "conv";
constexpr auto tpi = "tpi";
}  // namespace indicator

/// Per-indicator scores in [0, 1], absent when not computable.
struct Indicators {
  Score slope;
  Score aspect;
  Score form;
  Score longitudinal;
  Score water;
  Score conv;
  Score tpi;

  /// Lookup by indicator key; unknown keys are absent.
  Score get(const std::string& key) const;
};

/// Cosine score of the angular distance to the context's aspect target,
/// raised to max(0.5, sharpness).
Score scoreAspect(const Score& aspect_deg, const CulturalContext& ctx);

/// Gaussian over distance to water; below 30 m capped at max(0.1, half).
Score scoreWaterDistance(const Score& distance_m, const CulturalContext& ctx);

/// 0.7 x distance score + 0.3 x terrain wetness, or whichever is present.
Score combineHydroScores(const Score& distance_score, const Score& dem_score);

/// Add the context weight bias (floored at 0) and renormalise to sum 1.
config::Profile contextualizeProfile(const config::Profile& profile,
                                     const CulturalContext& ctx);

/// Weighted mean of present indicators x 100.
Score profileWeightedScore(const Indicators& indicators,
                           const config::Profile& profile);

/// Share of the total weight backed by a present indicator.
Score profileConfidence(const Indicators& indicators,
                        const config::Profile& profile);

/// Top two weight x score contributors as "key:value,key:value".
std::string explainTopFactors(const Indicators& indicators,
                              const config::Profile& profile);

/// Known per-site inputs. Absent slope/aspect are derived from the DEM.
struct SiteInputs {
  Score slope_deg;
  Score aspect_deg;
  Score water_distance_m;
};

struct SiteAssessment {
  Indicators indicators;
  TerrainMetrics metrics;
  Score slope_deg;
  Score aspect_deg;
  Score total;       ///< 0..100
  Score confidence;  ///< 0..1
  std::string note;
  std::string reason;
};

class SiteScorer {
 public:
  SiteScorer(const ElevationSource& source, const Config& cfg,
             const std::string& profile_key, const CulturalContext& ctx);

  SiteAssessment assess(const Point2& site, const SiteInputs& inputs) const;

  const config::Profile& profile() const { return profile_; }
  const std::string& profileKey() const { return profile_key_; }
  const CulturalContext& context() const { return ctx_; }

 private:
  const ElevationSource& source_;
  TerrainMetricEngine engine_;
  std::string profile_key_;
  config::Profile profile_;
  CulturalContext ctx_;
};

}  // namespace geomancy

#endif  // GEOMANCY_SCORING_SITE_SCORER_HPP
