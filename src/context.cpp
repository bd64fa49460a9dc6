// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/context.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace geomancy {

namespace {

constexpr double kMinWaterSigma = 120.0;
constexpr double kMinThreshold = 0.50;
constexpr double kMaxThreshold = 0.90;

config::BiasMap mergeBias(const config::BiasMap& a, const config::BiasMap& b) {
  config::BiasMap merged = a;
  for (const auto& [key, delta] : b) merged[key] += delta;
  return merged;
}

template <typename Catalog>
typename Catalog::const_iterator resolve(const Catalog& catalog,
                                         const std::string& key,
                                         const char* fallback,
                                         const char* what) {
  auto it = catalog.find(key);
  if (it != catalog.end()) return it;
  it = catalog.find(fallback);
  if (it == catalog.end()) it = catalog.begin();
  if (it != catalog.end()) {
    spdlog::warn("[Context] Unknown {} '{}', using '{}'", what, key, it->first);
  }
  return it;
}

}  // namespace

double CulturalContext::termBias(const std::string& term_id) const {
  auto it = term_bias.find(term_id);
  return it != term_bias.end() ? it->second : 0.0;
}

CulturalContext buildContext(const Config& cfg, const std::string& culture_key,
                             const std::string& period_key,
                             Hemisphere hemisphere) {
  const config::Culture default_culture;
  const config::Period default_period;

  auto culture_it =
      resolve(cfg.cultures, culture_key, config::kDefaultCulture, "culture");
  auto period_it =
      resolve(cfg.periods, period_key, config::kDefaultPeriod, "period");

  const bool has_culture = culture_it != cfg.cultures.end();
  const bool has_period = period_it != cfg.periods.end();
  const config::Culture& culture =
      has_culture ? culture_it->second : default_culture;
  const config::Period& period =
      has_period ? period_it->second : default_period;

  CulturalContext ctx;
  ctx.culture_key = has_culture ? culture_it->first : config::kDefaultCulture;
  ctx.period_key = has_period ? period_it->first : config::kDefaultPeriod;
  ctx.hemisphere = hemisphere;
  ctx.aspect_target = hemisphere == Hemisphere::North
                          ? culture.aspect_target_north
                          : culture.aspect_target_south;
  ctx.aspect_sharpness = culture.aspect_sharpness;
  ctx.water_distance_target =
      culture.water_distance_target + period.water_target_shift;
  ctx.water_distance_sigma =
      std::max(kMinWaterSigma,
               culture.water_distance_sigma + period.water_sigma_shift);
  ctx.macro_radius_multiplier =
      culture.macro_radius_multiplier * period.macro_radius_multiplier;
  ctx.micro_radius_multiplier =
      culture.micro_radius_multiplier * period.micro_radius_multiplier;
  ctx.candidate_threshold =
      std::clamp(culture.candidate_threshold + period.threshold_shift,
                 kMinThreshold, kMaxThreshold);
  ctx.weight_bias = mergeBias(culture.weight_bias, period.weight_bias);
  ctx.term_bias = culture.term_bias;
  ctx.term_target_shift = culture.term_target_shift + period.term_target_shift;
  return ctx;
}

}  // namespace geomancy
