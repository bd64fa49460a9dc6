// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_geomancy.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>
#include <stdexcept>

#include "geomancy/config/geomancy.hpp"

namespace geomancy {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

void loadTarget(const YAML::Node& node, const std::string& key,
                GaussianTarget& value) {
  if (auto n = node[key]) {
    load(n, "target", value.target);
    load(n, "sigma", value.sigma);
  }
}

RadiusClass parseRadiusClass(const std::string& name) {
  if (name == "inner") return RadiusClass::Inner;
  if (name == "outer") return RadiusClass::Outer;
  if (name == "far") return RadiusClass::Far;
  throw std::invalid_argument("terms.catalog: unknown radius class '" + name +
                              "'");
}

config::TermSpec parseTermSpec(const YAML::Node& n) {
  config::TermSpec spec;
  load(n, "term_id", spec.term_id);
  if (spec.term_id.empty()) {
    throw std::invalid_argument("terms.catalog: entry without term_id");
  }
  std::string radius = "inner";
  std::string direction = "front";
  std::string mode = "max";
  load(n, "radius", radius);
  load(n, "direction", direction);
  load(n, "mode", mode);
  spec.radius = parseRadiusClass(radius);
  auto dir = parseDirection(direction);
  if (!dir) {
    throw std::invalid_argument("terms.catalog: unknown direction '" +
                                direction + "' for " + spec.term_id);
  }
  spec.direction = *dir;
  auto m = parseExtremumMode(mode);
  if (!m) {
    throw std::invalid_argument("terms.catalog: unknown mode '" + mode +
                                "' for " + spec.term_id);
  }
  spec.mode = *m;
  load(n, "target", spec.target);
  load(n, "sigma", spec.sigma);
  return spec;
}

void parseProfile(const YAML::Node& n, config::Profile& p) {
  load(n, "label", p.label);
  if (auto w = n["weights"]) {
    p.weights = w.as<std::map<std::string, double>>();
  }
  loadTarget(n, "slope", p.slope);
  loadTarget(n, "tpi", p.tpi);
}

void parseCulture(const YAML::Node& n, config::Culture& c) {
  if (auto a = n["aspect_targets"]) {
    load(a, "north", c.aspect_target_north);
    load(a, "south", c.aspect_target_south);
  }
  load(n, "aspect_sharpness", c.aspect_sharpness);
  load(n, "water_distance_target", c.water_distance_target);
  load(n, "water_distance_sigma", c.water_distance_sigma);
  load(n, "macro_radius_multiplier", c.macro_radius_multiplier);
  load(n, "micro_radius_multiplier", c.micro_radius_multiplier);
  load(n, "candidate_threshold", c.candidate_threshold);
  load(n, "weight_bias", c.weight_bias);
  load(n, "term_bias", c.term_bias);
  load(n, "term_target_shift", c.term_target_shift);
}

void parsePeriod(const YAML::Node& n, config::Period& p) {
  load(n, "water_target_shift", p.water_target_shift);
  load(n, "water_sigma_shift", p.water_sigma_shift);
  load(n, "macro_radius_multiplier", p.macro_radius_multiplier);
  load(n, "micro_radius_multiplier", p.micro_radius_multiplier);
  load(n, "threshold_shift", p.threshold_shift);
  load(n, "weight_bias", p.weight_bias);
  load(n, "term_target_shift", p.term_target_shift);
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Ring / sector sampling
  if (auto n = root["sampling"]) {
    auto& s = cfg.sampling;
    load(n, "micro_radius_factor", s.micro_radius_factor);
    load(n, "macro_radius_factor", s.macro_radius_factor);
    load(n, "macro_bearing_step", s.macro_bearing_step);
    load(n, "micro_bearing_step", s.micro_bearing_step);
    load(n, "sector_samples", s.sector_samples);
    load(n, "sector_span", s.sector_span);
    load(n, "ring_extremum_step", s.ring_extremum_step);
    load(n, "gentle_half_span", s.gentle_half_span);
    load(n, "gentle_step", s.gentle_step);
  }

  // Terrain shape metrics
  if (auto n = root["terrain_metrics"]) {
    auto& t = cfg.terrain_metrics;
    loadTarget(n, "form_back", t.form_back);
    loadTarget(n, "form_front", t.form_front);
    loadTarget(n, "form_side", t.form_side);
    loadTarget(n, "tpi_shape", t.tpi_shape);
    loadTarget(n, "hierarchy", t.hierarchy);
    loadTarget(n, "wetness", t.wetness);
    load(n, "slope_denominator", t.slope_denominator);
    load(n, "min_slope_factor", t.min_slope_factor);
    load(n, "unknown_slope_factor", t.unknown_slope_factor);
  }

  // Candidate search
  if (auto n = root["candidate_search"]) {
    auto& c = cfg.candidate_search;
    load(n, "spacing_factor", c.spacing_factor);
    load(n, "span_divisor", c.span_divisor);
    load(n, "max_cells", c.max_cells);
    load(n, "tpi_min", c.tpi_min);
    load(n, "tpi_max", c.tpi_max);
    loadTarget(n, "tpi", c.tpi);
    load(n, "sparse_separation", c.sparse_separation);
    load(n, "dense_separation", c.dense_separation);
  }

  // Landmarks
  if (auto n = root["terms"]) {
    auto& t = cfg.terms;
    load(n, "inner_radius_scale", t.inner_radius_scale);
    load(n, "outer_radius_scale", t.outer_radius_scale);
    load(n, "far_radius_scale", t.far_radius_scale);
    load(n, "relief_bearing_step", t.relief_bearing_step);
    load(n, "min_score", t.min_score);
    load(n, "threshold_ratio", t.threshold_ratio);
    load(n, "basin_offset", t.basin_offset);
    loadTarget(n, "basin", t.basin);
    load(n, "basin_shift_ratio", t.basin_shift_ratio);
    loadTarget(n, "inflow", t.inflow);
    loadTarget(n, "apron", t.apron);
    load(n, "apron_shift_ratio", t.apron_shift_ratio);
    if (auto catalog = n["catalog"]) {
      t.catalog.clear();
      for (const auto& entry : catalog) {
        t.catalog.push_back(parseTermSpec(entry));
      }
    }
    if (auto names = n["names"]) {
      for (const auto& [id, label] :
           names.as<std::map<std::string, std::string>>()) {
        t.names[id] = label;
      }
    }
  }

  // Structural links
  if (auto n = root["links"]) {
    auto& l = cfg.links;
    load(n, "min_score", l.min_score);
    load(n, "bend_ratio", l.bend_ratio);
    load(n, "curved", l.curved);
    if (auto plan = n["plan"]) {
      l.plan.clear();
      for (const auto& entry : plan) {
        config::LinkSpec spec;
        load(entry, "source", spec.source);
        load(entry, "destination", spec.destination);
        load(entry, "style", spec.style);
        if (spec.style.empty()) spec.style = spec.source;
        l.plan.push_back(spec);
      }
    }
  }

  // Drainage network
  if (auto n = root["drainage"]) {
    auto& d = cfg.drainage;
    load(n, "spacing_factor", d.spacing_factor);
    load(n, "coarse_ratio", d.coarse_ratio);
    load(n, "max_cells", d.max_cells);
    load(n, "min_nodes", d.min_nodes);
    load(n, "min_drop", d.min_drop);
    load(n, "min_drop_ratio", d.min_drop_ratio);
    load(n, "min_accumulation", d.min_accumulation);
    load(n, "soft_keep_ratio", d.soft_keep_ratio);
    load(n, "path_length_factor", d.path_length_factor);
    load(n, "path_length_diagonal", d.path_length_diagonal);
  }

  // Ridge network
  if (auto n = root["ridge"]) {
    auto& r = cfg.ridge;
    load(n, "spacing_factor", r.spacing_factor);
    load(n, "coarse_ratio", r.coarse_ratio);
    load(n, "max_cells", r.max_cells);
    load(n, "min_nodes", r.min_nodes);
    load(n, "min_neighbors", r.min_neighbors);
    load(n, "prominence_floor", r.prominence_floor);
    load(n, "prominence_ratio", r.prominence_ratio);
    load(n, "neighbor_delta", r.neighbor_delta);
    load(n, "neighbor_delta_ratio", r.neighbor_delta_ratio);
    load(n, "majority_ratio", r.majority_ratio);
    load(n, "soft_majority_ratio", r.soft_majority_ratio);
    load(n, "soft_prominence_ratio", r.soft_prominence_ratio);
    load(n, "link_distance_factor", r.link_distance_factor);
    load(n, "link_drop", r.link_drop);
    load(n, "link_drop_ratio", r.link_drop_ratio);
    load(n, "bridge_distance_factor", r.bridge_distance_factor);
    load(n, "bridge_drop", r.bridge_drop);
    load(n, "bridge_drop_ratio", r.bridge_drop_ratio);
    load(n, "max_bridge_endpoints", r.max_bridge_endpoints);
    load(n, "rank_length_weight", r.rank_length_weight);
  }

  // Catalogs: entries merge into the built-in tables by key
  if (auto n = root["profiles"]) {
    for (const auto& entry : n) {
      parseProfile(entry.second, cfg.profiles[entry.first.as<std::string>()]);
    }
  }
  if (auto n = root["cultures"]) {
    for (const auto& entry : n) {
      parseCulture(entry.second, cfg.cultures[entry.first.as<std::string>()]);
    }
  }
  if (auto n = root["periods"]) {
    for (const auto& entry : n) {
      parsePeriod(entry.second, cfg.periods[entry.first.as<std::string>()]);
    }
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: inconsistent values that break the model ---
  auto& cs = cfg.candidate_search;
  if (cs.tpi_min >= cs.tpi_max) {
    throw std::invalid_argument(
        "candidate_search: tpi_min (" + std::to_string(cs.tpi_min) +
        ") >= tpi_max (" + std::to_string(cs.tpi_max) + ")");
  }

  std::set<std::string> term_ids;
  for (const auto& spec : cfg.terms.catalog) {
    if (!term_ids.insert(spec.term_id).second) {
      throw std::invalid_argument("terms.catalog: duplicate term_id '" +
                                  spec.term_id + "'");
    }
  }

  for (const auto& link : cfg.links.plan) {
    if (link.source.empty() || link.destination.empty()) {
      throw std::invalid_argument(
          "links.plan: every entry needs source and destination");
    }
  }

  for (const auto& [key, profile] : cfg.profiles) {
    for (const auto& [indicator, weight] : profile.weights) {
      if (weight < 0.0) {
        throw std::invalid_argument("profiles." + key + ".weights." +
                                    indicator + " must be >= 0");
      }
    }
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<decltype(val)>(lo),
                       static_cast<decltype(val)>(hi));
    }
  };

  auto warn_clamp_positive = [](const std::string& name, double& val,
                                double fallback) {
    if (!(val > 0.0)) {
      spdlog::warn("[Config] {} ({}) must be > 0, clamping to {}", name, val,
                   fallback);
      val = fallback;
    }
  };

  auto& s = cfg.sampling;
  warn_clamp_positive("sampling.micro_radius_factor", s.micro_radius_factor, 2.0);
  warn_clamp_positive("sampling.macro_radius_factor", s.macro_radius_factor,
                      12.0);
  warn_clamp("sampling.macro_bearing_step", s.macro_bearing_step, 1, 180);
  warn_clamp("sampling.micro_bearing_step", s.micro_bearing_step, 1, 180);
  warn_clamp("sampling.sector_samples", s.sector_samples, 1, 360);
  warn_clamp("sampling.sector_span", s.sector_span, 0.0, 360.0);
  warn_clamp("sampling.ring_extremum_step", s.ring_extremum_step, 1, 180);
  warn_clamp("sampling.gentle_half_span", s.gentle_half_span, 0.0, 180.0);
  warn_clamp("sampling.gentle_step", s.gentle_step, 1, 180);

  auto& tm = cfg.terrain_metrics;
  warn_clamp_positive("terrain_metrics.slope_denominator", tm.slope_denominator,
                      35.0);
  warn_clamp("terrain_metrics.min_slope_factor", tm.min_slope_factor, 0.0, 1.0);
  warn_clamp("terrain_metrics.unknown_slope_factor", tm.unknown_slope_factor,
             0.0, 1.0);

  warn_clamp_positive("candidate_search.spacing_factor", cs.spacing_factor,
                      10.0);
  warn_clamp_positive("candidate_search.span_divisor", cs.span_divisor, 180.0);
  warn_clamp("candidate_search.max_cells", cs.max_cells, 1, 10'000'000);
  warn_clamp_positive("candidate_search.sparse_separation",
                      cs.sparse_separation, 10.5);
  warn_clamp_positive("candidate_search.dense_separation", cs.dense_separation,
                      9.0);

  auto& t = cfg.terms;
  warn_clamp_positive("terms.inner_radius_scale", t.inner_radius_scale, 18.0);
  warn_clamp_positive("terms.outer_radius_scale", t.outer_radius_scale, 38.0);
  warn_clamp_positive("terms.far_radius_scale", t.far_radius_scale, 65.0);
  warn_clamp("terms.relief_bearing_step", t.relief_bearing_step, 1, 180);
  warn_clamp("terms.min_score", t.min_score, 0.0, 1.0);

  warn_clamp("links.min_score", cfg.links.min_score, 0.0, 1.0);
  warn_clamp("links.bend_ratio", cfg.links.bend_ratio, 0.0, 1.0);

  auto& d = cfg.drainage;
  warn_clamp_positive("drainage.spacing_factor", d.spacing_factor, 3.2);
  warn_clamp("drainage.max_cells", d.max_cells, 4, 10'000'000);
  warn_clamp("drainage.min_nodes", d.min_nodes, 2, 1'000'000);
  warn_clamp_positive("drainage.min_drop", d.min_drop, 0.15);
  warn_clamp("drainage.soft_keep_ratio", d.soft_keep_ratio, 0.0, 1.0);

  auto& r = cfg.ridge;
  warn_clamp_positive("ridge.spacing_factor", r.spacing_factor, 4.0);
  warn_clamp("ridge.max_cells", r.max_cells, 4, 10'000'000);
  warn_clamp("ridge.min_nodes", r.min_nodes, 2, 1'000'000);
  warn_clamp("ridge.min_neighbors", r.min_neighbors, 1, 8);
  warn_clamp_positive("ridge.prominence_floor", r.prominence_floor, 0.6);
  warn_clamp("ridge.majority_ratio", r.majority_ratio, 0.0, 1.0);
  warn_clamp("ridge.soft_majority_ratio", r.soft_majority_ratio, 0.0, 1.0);
  warn_clamp("ridge.rank_length_weight", r.rank_length_weight, 0.0, 1.0);
  warn_clamp("ridge.max_bridge_endpoints", r.max_bridge_endpoints, 0,
             1'000'000);

  for (auto& [key, culture] : cfg.cultures) {
    warn_clamp("cultures." + key + ".candidate_threshold",
               culture.candidate_threshold, 0.0, 1.0);
    warn_clamp_positive("cultures." + key + ".macro_radius_multiplier",
                        culture.macro_radius_multiplier, 1.0);
    warn_clamp_positive("cultures." + key + ".micro_radius_multiplier",
                        culture.micro_radius_multiplier, 1.0);
  }
  for (auto& [key, period] : cfg.periods) {
    warn_clamp_positive("periods." + key + ".macro_radius_multiplier",
                        period.macro_radius_multiplier, 1.0);
    warn_clamp_positive("periods." + key + ".micro_radius_multiplier",
                        period.micro_radius_multiplier, 1.0);
  }
}

}  // namespace detail

const config::Profile& Config::profile(const std::string& key) const {
  static const config::Profile fallback = config::fallbackProfile();
  if (profiles.empty()) return fallback;
  auto it = profiles.find(key);
  if (it != profiles.end()) return it->second;
  it = profiles.find(config::kDefaultProfile);
  if (it != profiles.end()) return it->second;
  return profiles.begin()->second;
}

Config parseConfig(const YAML::Node& root) {
  Config cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace geomancy
