// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CONFIG_SAMPLING_HPP
#define GEOMANCY_CONFIG_SAMPLING_HPP

#include "geomancy/score.hpp"

namespace geomancy::config {

/// Ring and sector sampling geometry. Radii scale with the DEM step.
struct Sampling {
  double micro_radius_factor = 2.0;   ///< Micro ring radius = step x factor
  double macro_radius_factor = 12.0;  ///< Macro ring radius = step x factor
  int macro_bearing_step = 22;        ///< Macro ring bearing step [deg]
  int micro_bearing_step = 45;        ///< Micro ring bearing step [deg]
  int sector_samples = 17;            ///< Azimuths per sector search
  double sector_span = 80.0;          ///< Sector width [deg]
  int ring_extremum_step = 8;         ///< Full-circle search step [deg]
  double gentle_half_span = 45.0;     ///< Gentle-point sector half width [deg]
  int gentle_step = 6;                ///< Gentle-point bearing step [deg]
};

/// Targets of the terrain shape metrics (relief-normalised).
struct TerrainMetrics {
  GaussianTarget form_back{0.20, 0.35};   ///< (back - center) / relief
  GaussianTarget form_front{0.15, 0.35};  ///< (center - front) / relief
  GaussianTarget form_side{0.05, 0.25};   ///< (left - right) / relief
  GaussianTarget tpi_shape{-0.10, 0.30};  ///< Normalised TPI
  GaussianTarget hierarchy{0.55, 0.30};   ///< std(micro) / std(macro)
  GaussianTarget wetness{0.60, 0.28};     ///< Convergence ratio
  double slope_denominator = 35.0;        ///< Slope [deg] at which factor bottoms out
  double min_slope_factor = 0.25;
  double unknown_slope_factor = 0.75;     ///< Factor when slope is not known
};

/// Grid scan for core-point candidates.
struct CandidateSearch {
  double spacing_factor = 10.0;  ///< Min spacing = step x factor
  double span_divisor = 180.0;   ///< Min spacing = shorter span / divisor
  int max_cells = 12000;         ///< Spacing grows until the grid fits
  double tpi_min = -0.45;        ///< Reject cells with TPI below
  double tpi_max = 0.35;         ///< Reject cells with TPI above
  GaussianTarget tpi{-0.08, 0.30};
  double sparse_separation = 10.5;  ///< Separation / spacing when keeping <= 3
  double dense_separation = 9.0;    ///< Separation / spacing otherwise
};

}  // namespace geomancy::config

#endif  // GEOMANCY_CONFIG_SAMPLING_HPP
