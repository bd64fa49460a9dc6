// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_TERMS_STRUCTURAL_LINKER_HPP
#define GEOMANCY_TERMS_STRUCTURAL_LINKER_HPP

#include <optional>

#include "geomancy/config/terms.hpp"
#include "geomancy/layers.hpp"

namespace geomancy {

/// Straight 2-point path, or a 3-point path whose middle vertex is the
/// segment midpoint pulled `bend_ratio` of the way toward `center`.
Polyline linkPath(const Point2& origin, const Point2& destination,
                  const std::optional<Point2>& center, double bend_ratio);

/**
 * @brief Connects landmarks of the same candidate along the link plan.
 *
 * Landmarks are grouped by parent id in first-seen order; within a group
 * a later landmark replaces an earlier one with the same term id. An edge
 * (parent, unordered term pair, style) is considered once.
 */
class StructuralLinker {
 public:
  StructuralLinker(const config::Links& links, const config::Terms& terms)
      : links_(links), terms_(terms) {}

  LinkLayer link(const LandmarkLayer& landmarks) const;

 private:
  config::Links links_;
  config::Terms terms_;
};

}  // namespace geomancy

#endif  // GEOMANCY_TERMS_STRUCTURAL_LINKER_HPP
