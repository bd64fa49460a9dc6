// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * analyzer.hpp
 *
 * Geomancy: public analysis API over one elevation source.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_ANALYZER_HPP
#define GEOMANCY_ANALYZER_HPP

#include <memory>
#include <string>
#include <vector>

// Configs
#include "geomancy/config/geomancy.hpp"
#include "geomancy/context.hpp"

// Data types
#include "geomancy/cancellation.hpp"
#include "geomancy/elevation_source.hpp"
#include "geomancy/layers.hpp"
#include "geomancy/outcome.hpp"
#include "geomancy/spatial/water_index.hpp"

namespace geomancy {

/// Per-call options shared by the scoring and extraction operations.
struct RunOptions {
  Hemisphere hemisphere = Hemisphere::North;
  std::string profile = config::kDefaultProfile;
  std::string culture = config::kDefaultCulture;
  std::string period = config::kDefaultPeriod;
  int max_candidates = 5;
  /// Score sites against the built drainage network when no water index
  /// is set.
  bool auto_hydro = false;
};

/// Input site. Absent slope/aspect are derived from the DEM.
struct Site {
  int id = 0;
  Point2 point = Point2::Zero();
  Score slope_deg;
  Score aspect_deg;
};

/**
 * @brief Runs each analysis with validation, cancellation and outcome
 * reporting.
 *
 * Preconditions are checked before any computation (InvalidInput). A
 * signalled token yields Cancelled and any other exception Failed; neither
 * carries a partial layer.
 *
 * ## Thread safety
 * Operations are const and build all grids locally, so concurrent calls on
 * one Analyzer are safe as long as the elevation source is not modified.
 */
class Analyzer {
 public:
  explicit Analyzer(ElevationSource::ConstPtr dem, Config cfg = Config());

  // Non-copyable
  Analyzer(const Analyzer&) = delete;
  Analyzer& operator=(const Analyzer&) = delete;

  /// Water geometry used for site scoring (nullptr clears it).
  Analyzer& setWaterIndex(std::shared_ptr<const WaterIndex> water);

  Outcome<SiteScoreLayer> scoreSites(const std::vector<Site>& sites,
                                     const RunOptions& options = {},
                                     const CancellationToken& token = {}) const;

  /// Candidate search followed by landmark derivation.
  Outcome<LandmarkLayer> extractTerms(const RunOptions& options = {},
                                      const CancellationToken& token = {}) const;

  Outcome<LinkLayer> buildTermLinks(const LandmarkLayer& landmarks) const;

  Outcome<DrainageLayer> buildDrainageNetwork(
      const CancellationToken& token = {}) const;

  Outcome<RidgeLayer> buildRidgeNetwork(
      const CancellationToken& token = {}) const;

  const Config& config() const { return cfg_; }

 private:
  /// Empty when the elevation source is usable.
  std::string checkSource() const;

  CulturalContext context(const RunOptions& options) const;

  ElevationSource::ConstPtr dem_;
  Config cfg_;
  std::shared_ptr<const WaterIndex> water_;
};

}  // namespace geomancy

#endif  // GEOMANCY_ANALYZER_HPP
