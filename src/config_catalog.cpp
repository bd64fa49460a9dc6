// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_catalog.cpp
 *
 * Built-in landmark catalog, link plan, scoring profiles and
 * cultural/period tables.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "geomancy/config/context.hpp"
#include "geomancy/config/terms.hpp"

namespace geomancy::config {

// ─── Landmarks ──────────────────────────────────────────────────────────────

std::vector<TermSpec> Terms::defaultCatalog() {
  using D = Direction;
  using M = ExtremumMode;
  using R = RadiusClass;
  return {
      {term::near_back_peak, R::Inner, D::Back, M::Max, 0.12, 0.30},
      {term::back_peak, R::Outer, D::Back, M::Max, 0.30, 0.35},
      {term::far_back_peak, R::Far, D::Back, M::Max, 0.50, 0.40},
      {term::left_inner, R::Inner, D::Left, M::Max, 0.10, 0.30},
      {term::left_outer, R::Outer, D::Left, M::Max, 0.20, 0.35},
      {term::right_inner, R::Inner, D::Right, M::Max, 0.10, 0.30},
      {term::right_outer, R::Outer, D::Right, M::Max, 0.20, 0.35},
      {term::near_front_peak, R::Outer, D::Front, M::Max, 0.05, 0.30},
      {term::far_front_peak, R::Far, D::Front, M::Max, 0.18, 0.35},
      {term::near_outlet, R::Inner, D::Front, M::Min, -0.12, 0.30},
      {term::far_outlet, R::Outer, D::Front, M::Min, -0.25, 0.35},
  };
}

std::map<std::string, std::string> Terms::defaultNames() {
  return {
      {term::core, "Core Point"},
      {term::basin, "Bright Hall"},
      {term::near_back_peak, "Head Mound"},
      {term::back_peak, "Main Mountain"},
      {term::far_back_peak, "Ancestral Mountain"},
      {term::left_inner, "Inner Blue Dragon"},
      {term::left_outer, "Outer Blue Dragon"},
      {term::right_inner, "Inner White Tiger"},
      {term::right_outer, "Outer White Tiger"},
      {term::near_front_peak, "Table Mountain"},
      {term::far_front_peak, "Court Mountain"},
      {term::near_outlet, "Inner Water Gate"},
      {term::far_outlet, "Outer Water Gate"},
      {term::inflow, "Water Inflow"},
      {term::apron, "Front Apron"},
  };
}

std::string Terms::name(const std::string& term_id) const {
  auto it = names.find(term_id);
  return it != names.end() ? it->second : term_id;
}

std::vector<LinkSpec> Links::defaultPlan() {
  return {
      {term::back_peak, term::near_back_peak, term::back_peak},
      {term::near_back_peak, term::far_back_peak, term::near_back_peak},
      {term::left_inner, term::left_outer, term::left_inner},
      {term::right_inner, term::right_outer, term::right_inner},
      {term::near_front_peak, term::far_front_peak, term::near_front_peak},
      {term::basin, term::apron, term::basin},
      {term::near_outlet, term::far_outlet, term::near_outlet},
      {term::near_outlet, term::inflow, term::near_outlet},
  };
}

// ─── Scoring profiles ───────────────────────────────────────────────────────

std::map<std::string, Profile> defaultProfiles() {
  std::map<std::string, Profile> profiles;
  profiles["general"] = {"General",
                         {{"slope", 0.18},
                          {"aspect", 0.14},
                          {"form", 0.18},
                          {"long", 0.14},
                          {"water", 0.16},
                          {"conv", 0.08},
                          {"tpi", 0.12}},
                         {8.0, 10.0},
                         {-0.05, 0.35}};
  profiles["settlement"] = {"Settlement",
                            {{"slope", 0.24},
                             {"aspect", 0.16},
                             {"form", 0.12},
                             {"long", 0.08},
                             {"water", 0.22},
                             {"conv", 0.08},
                             {"tpi", 0.10}},
                            {5.0, 8.0},
                            {-0.10, 0.35}};
  profiles["burial"] = {"Burial",
                        {{"slope", 0.12},
                         {"aspect", 0.18},
                         {"form", 0.24},
                         {"long", 0.18},
                         {"water", 0.08},
                         {"conv", 0.06},
                         {"tpi", 0.14}},
                        {12.0, 10.0},
                        {0.05, 0.30}};
  return profiles;
}

Profile fallbackProfile() {
  return {"Default",
          {{"slope", 0.4}, {"aspect", 0.3}, {"water", 0.3}},
          {8.0, 10.0},
          {0.0, 0.4}};
}

// ─── Cultures and periods ───────────────────────────────────────────────────

std::map<std::string, Culture> defaultCultures() {
  std::map<std::string, Culture> cultures;

  cultures["east_asia"] = Culture{};

  Culture china;
  china.aspect_sharpness = 1.10;
  china.water_distance_target = 260.0;
  china.water_distance_sigma = 420.0;
  china.macro_radius_multiplier = 1.20;
  china.micro_radius_multiplier = 1.05;
  china.candidate_threshold = 0.64;
  china.weight_bias = {{"long", 0.07}, {"water", 0.05}, {"form", 0.03},
                       {"tpi", -0.03}};
  china.term_bias = {{term::back_peak, 0.04},
                     {term::far_back_peak, 0.06},
                     {term::near_outlet, 0.03},
                     {term::far_outlet, 0.04}};
  china.term_target_shift = 0.03;
  cultures["china"] = china;

  Culture korea;
  korea.aspect_sharpness = 1.15;
  korea.water_distance_target = 210.0;
  korea.water_distance_sigma = 330.0;
  korea.macro_radius_multiplier = 1.10;
  korea.micro_radius_multiplier = 1.0;
  korea.candidate_threshold = 0.64;
  korea.weight_bias = {{"form", 0.06}, {"long", 0.04}, {"water", 0.02},
                       {"aspect", 0.02}, {"slope", -0.03}};
  korea.term_bias = {{term::near_front_peak, 0.05},
                     {term::far_front_peak, 0.05},
                     {term::left_inner, 0.04},
                     {term::right_inner, 0.04},
                     {term::near_outlet, 0.04}};
  korea.term_target_shift = 0.01;
  cultures["korea"] = korea;

  Culture japan;
  japan.aspect_target_north = 170.0;
  japan.aspect_target_south = 350.0;
  japan.aspect_sharpness = 0.85;
  japan.water_distance_target = 240.0;
  japan.water_distance_sigma = 360.0;
  japan.macro_radius_multiplier = 1.0;
  japan.micro_radius_multiplier = 0.95;
  japan.candidate_threshold = 0.60;
  japan.weight_bias = {{"aspect", 0.05}, {"form", 0.03}, {"water", -0.03},
                       {"long", 0.01}};
  japan.term_bias = {{term::left_inner, 0.03},
                     {term::left_outer, 0.02},
                     {term::right_inner, 0.03},
                     {term::right_outer, 0.02},
                     {term::near_front_peak, 0.02}};
  japan.term_target_shift = -0.01;
  cultures["japan"] = japan;

  Culture ryukyu;
  ryukyu.aspect_target_north = 165.0;
  ryukyu.aspect_target_south = 345.0;
  ryukyu.aspect_sharpness = 0.90;
  ryukyu.water_distance_target = 180.0;
  ryukyu.water_distance_sigma = 310.0;
  ryukyu.macro_radius_multiplier = 0.90;
  ryukyu.micro_radius_multiplier = 1.05;
  ryukyu.candidate_threshold = 0.59;
  ryukyu.weight_bias = {{"water", 0.10}, {"conv", 0.04}, {"long", -0.05},
                        {"form", 0.01}};
  ryukyu.term_bias = {{term::inflow, 0.06},
                      {term::near_outlet, 0.05},
                      {term::far_outlet, 0.05}};
  ryukyu.term_target_shift = -0.03;
  cultures["ryukyu"] = ryukyu;

  return cultures;
}

std::map<std::string, Period> defaultPeriods() {
  std::map<std::string, Period> periods;

  Period ancient;
  ancient.water_target_shift = 30.0;
  ancient.water_sigma_shift = 20.0;
  ancient.macro_radius_multiplier = 1.15;
  ancient.threshold_shift = 0.02;
  ancient.weight_bias = {{"long", 0.05}, {"form", 0.03}, {"water", -0.02},
                         {"aspect", -0.02}};
  ancient.term_target_shift = 0.02;
  periods["ancient"] = ancient;

  Period medieval;
  medieval.water_target_shift = 10.0;
  medieval.water_sigma_shift = 10.0;
  medieval.macro_radius_multiplier = 1.05;
  medieval.threshold_shift = 0.01;
  medieval.weight_bias = {{"form", 0.03}, {"long", 0.03}};
  medieval.term_target_shift = 0.01;
  periods["medieval"] = medieval;

  Period early_modern;
  early_modern.weight_bias = {{"aspect", 0.02}, {"water", 0.01}};
  periods["early_modern"] = early_modern;

  Period modern;
  modern.water_target_shift = -15.0;
  modern.water_sigma_shift = -20.0;
  modern.macro_radius_multiplier = 0.90;
  modern.threshold_shift = -0.03;
  modern.weight_bias = {{"water", 0.03}, {"conv", 0.03}, {"long", -0.04},
                        {"form", -0.02}};
  modern.term_target_shift = -0.02;
  periods["modern"] = modern;

  return periods;
}

}  // namespace geomancy::config
