// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONFIG_TERMS_HPP
#define GEOMANCY_CONFIG_TERMS_HPP

#include <map>
#include <string>
#include <vector>

#include "geomancy/orientation.hpp"
#include "geomancy/score.hpp"

namespace geomancy {

namespace term {
constexpr auto core = "hyeol";
constexpr auto basin = "myeongdang";
constexpr auto near_back_peak = "dunoe";
constexpr auto back_peak = "jusan";
constexpr auto far_back_peak = "jojongsan";
constexpr auto left_inner = "naecheongnyong";
constexpr auto left_outer = "oecheongnyong";
constexpr auto right_inner = "naebaekho";
constexpr auto right_outer = "oebaekho";
constexpr auto near_front_peak = "ansan";
constexpr auto far_front_peak = "josan";
constexpr auto near_outlet = "naesugu";
constexpr auto far_outlet = "oesugu";
constexpr auto inflow = "ipsu";
constexpr auto apron = "misa";
}  // namespace term

enum class RadiusClass { Inner, Outer, Far };

}  // namespace geomancy

namespace geomancy::config {

/// One directional landmark searched around every candidate.
struct TermSpec {
  std::string term_id;
  RadiusClass radius = RadiusClass::Inner;
  Direction direction = Direction::Front;
  ExtremumMode mode = ExtremumMode::Max;
  double target = 0.0;  ///< Expected (elev - center) / relief
  double sigma = 0.3;
};

/// Landmark derivation around candidates.
struct Terms {
  double inner_radius_scale = 18.0;  ///< x step x micro multiplier
  double outer_radius_scale = 38.0;  ///< x step x macro multiplier
  double far_radius_scale = 65.0;    ///< x step x macro multiplier
  int relief_bearing_step = 12;      ///< Relief ring step at outer radius [deg]
  double min_score = 0.42;           ///< Absolute landmark score floor
  double threshold_ratio = 0.72;     ///< Floor also >= candidate threshold x ratio
  double basin_offset = 0.35;        ///< Basin distance = inner radius x offset
  GaussianTarget basin{-0.03, 0.24};
  double basin_shift_ratio = 0.4;    ///< Share of the context target shift
  GaussianTarget inflow{-0.22, 0.35};
  GaussianTarget apron{-0.03, 0.20};
  double apron_shift_ratio = 0.5;
  std::vector<TermSpec> catalog = defaultCatalog();
  std::map<std::string, std::string> names = defaultNames();

  static std::vector<TermSpec> defaultCatalog();
  static std::map<std::string, std::string> defaultNames();

  /// Display name of a term id (the id itself when unnamed).
  std::string name(const std::string& term_id) const;
};

/// (source, destination, style) triple of the structural link plan.
struct LinkSpec {
  std::string source;
  std::string destination;
  std::string style;
};

/// Structural linking between landmarks of the same candidate.
struct Links {
  double min_score = 0.48;  ///< Drop links whose mean endpoint score is lower
  double bend_ratio = 0.35;  ///< Control point pull toward the core point
  bool curved = true;        ///< Emit 3-point bent paths when a core exists
  std::vector<LinkSpec> plan = defaultPlan();

  static std::vector<LinkSpec> defaultPlan();
};

}  // namespace geomancy::config

#endif  // GEOMANCY_CONFIG_TERMS_HPP
