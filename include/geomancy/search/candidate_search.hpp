// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * candidate_search.hpp
 *
 * Grid scan for core-point candidates with spatial non-maximum
 * suppression.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_SEARCH_CANDIDATE_SEARCH_HPP
#define GEOMANCY_SEARCH_CANDIDATE_SEARCH_HPP

#include <vector>

#include "geomancy/analysis/terrain_metrics.hpp"
#include "geomancy/cancellation.hpp"
#include "geomancy/config/geomancy.hpp"

namespace geomancy {

struct Candidate {
  Point2 point = Point2::Zero();
  double elevation = 0.0;
  double score = 0.0;  ///< Unweighted suitability in [0, 1]
  TerrainMetrics metrics;
};

/// Scan spacing: max(step x factor, shorter span / divisor), grown so that
/// the cell count stays under the configured cap.
double adaptiveSpacing(const Extent& extent, double step,
                       const config::CandidateSearch& cfg);

/// Keep count suggested by grid density (fewer for denser grids).
int recommendedCandidateCount(const Extent& extent, double spacing);

/// Greedy suppression over score-sorted candidates: keep one only if it is
/// at least `min_distance` from every kept one; stop at `keep`.
std::vector<Candidate> suppressNearDuplicates(
    const std::vector<Candidate>& sorted, double min_distance, int keep);

class CandidateSearch {
 public:
  struct Result {
    std::vector<Candidate> selected;
    size_t passed = 0;        ///< Candidates above threshold before suppression
    double spacing = 0.0;     ///< Scan spacing [m]
    double separation = 0.0;  ///< Suppression distance [m]
    int desired = 0;          ///< Effective keep count
  };

  CandidateSearch(const ElevationSource& source, const Config& cfg);

  /// All threshold-passing cells, sorted by score (descending, stable).
  /// @throws OperationCancelled
  std::vector<Candidate> collect(const CulturalContext& ctx, double spacing,
                                 const CancellationToken& token) const;

  /// Full search: spacing, collection and suppression.
  /// @throws OperationCancelled
  Result run(const CulturalContext& ctx, int max_candidates,
             const CancellationToken& token) const;

  double step() const { return engine_.step(); }

 private:
  const ElevationSource& source_;
  config::CandidateSearch cfg_;
  TerrainMetricEngine engine_;
};

}  // namespace geomancy

#endif  // GEOMANCY_SEARCH_CANDIDATE_SEARCH_HPP
