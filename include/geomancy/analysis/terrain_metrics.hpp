// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * terrain_metrics.hpp
 *
 * Ring-based terrain shape metrics around a site: relief, form,
 * longitudinal (TPI + hierarchy) and convergence/wetness.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_ANALYSIS_TERRAIN_METRICS_HPP
#define GEOMANCY_ANALYSIS_TERRAIN_METRICS_HPP

#include "geomancy/analysis/ring_sampler.hpp"
#include "geomancy/config/sampling.hpp"
#include "geomancy/context.hpp"

namespace geomancy {

/// Metric bundle of one site. Every member is absent when its inputs are.
struct TerrainMetrics {
  Score center;       ///< Elevation at the site [m]
  Score relief;       ///< max - min of the macro ring [m]
  Score form_score;   ///< Back/front/side shape fit
  Score long_score;   ///< TPI shape + ring hierarchy fit
  Score wetness;      ///< Convergence fit scaled by slope
  Score tpi;          ///< (center - macro mean) / relief
  Score convergence;  ///< Micro-ring share above the centre
};

/**
 * @brief Computes TerrainMetrics from ring samples.
 *
 * Radii are step x factor x context multiplier; the step is the source's
 * coarser pixel size. Zero relief yields absent form/long/TPI rather than
 * a division by zero.
 */
class TerrainMetricEngine {
 public:
  TerrainMetricEngine(const ElevationSource& source,
                      const config::Sampling& sampling,
                      const config::TerrainMetrics& metrics);

  /// @param slope_deg Known slope at the site, if any
  TerrainMetrics compute(const Point2& site, const Score& slope_deg,
                         const CulturalContext& ctx) const;

  double step() const { return step_; }
  double microRadius(const CulturalContext& ctx) const;
  double macroRadius(const CulturalContext& ctx) const;

 private:
  RingSampler sampler_;
  config::Sampling sampling_;
  config::TerrainMetrics metrics_;
  double step_;
  std::vector<double> macro_bearings_;
  std::vector<double> micro_bearings_;
};

}  // namespace geomancy

#endif  // GEOMANCY_ANALYSIS_TERRAIN_METRICS_HPP
