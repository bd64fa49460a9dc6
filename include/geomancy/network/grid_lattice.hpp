// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_lattice.hpp
 *
 * Regularly sampled elevation lattice shared by the network builders.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_NETWORK_GRID_LATTICE_HPP
#define GEOMANCY_NETWORK_GRID_LATTICE_HPP

#include <cstdint>
#include <vector>

#include "geomancy/cancellation.hpp"
#include "geomancy/elevation_source.hpp"

namespace geomancy {

/// Grow `spacing` by sqrt(cells / max_cells) when the grid over `extent`
/// would hold more than `max_cells` cells.
double cappedSpacing(const Extent& extent, double spacing, int max_cells);

/**
 * @brief Column-major node arena with a presence bitmap.
 *
 * Node keys are col * rows + row, so ascending keys visit columns from
 * west to east and rows from south to north. Cells whose sample is
 * missing are absent and never appear as neighbours.
 */
class GridLattice {
 public:
  static constexpr int kNone = -1;

  GridLattice() = default;

  /// Nodes at min + spacing/2, min + 3*spacing/2, ... below the maximum.
  /// @throws OperationCancelled (polled once per column)
  static GridLattice sample(const ElevationSource& source, double spacing,
                            const CancellationToken& token = {});

  int cols() const { return static_cast<int>(xs_.size()); }
  int rows() const { return static_cast<int>(ys_.size()); }
  int size() const { return cols() * rows(); }
  double spacing() const { return spacing_; }
  const Extent& extent() const { return extent_; }

  int key(int col, int row) const { return col * rows() + row; }
  int col(int key) const { return key / rows(); }
  int row(int key) const { return key % rows(); }

  bool present(int key) const { return present_[key] != 0; }

  /// Key of the present node at (col + dc, row + dr), or kNone.
  int neighbor(int key, int dc, int dr) const;

  Point2 point(int key) const { return {xs_[col(key)], ys_[row(key)]}; }
  double elevation(int key) const { return elevation_[key]; }

  /// Present keys in ascending order.
  const std::vector<int>& nodes() const { return nodes_; }
  size_t nodeCount() const { return nodes_.size(); }

  double minElevation() const { return min_elevation_; }
  double maxElevation() const { return max_elevation_; }

 private:
  double spacing_ = 0.0;
  Extent extent_;
  std::vector<double> xs_;
  std::vector<double> ys_;
  std::vector<double> elevation_;
  std::vector<uint8_t> present_;
  std::vector<int> nodes_;
  double min_elevation_ = 0.0;
  double max_elevation_ = 0.0;
};

}  // namespace geomancy

#endif  // GEOMANCY_NETWORK_GRID_LATTICE_HPP
