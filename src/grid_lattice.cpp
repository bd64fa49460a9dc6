// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/network/grid_lattice.hpp"

#include <algorithm>
#include <cmath>

namespace geomancy {

double cappedSpacing(const Extent& extent, double spacing, int max_cells) {
  const int cols = std::max(1, static_cast<int>(extent.width() / spacing) + 1);
  const int rows = std::max(1, static_cast<int>(extent.height() / spacing) + 1);
  const double total = static_cast<double>(cols) * rows;
  if (max_cells > 0 && total > max_cells) {
    spacing *= std::sqrt(total / max_cells);
  }
  return spacing;
}

GridLattice GridLattice::sample(const ElevationSource& source, double spacing,
                                const CancellationToken& token) {
  GridLattice lattice;
  lattice.spacing_ = spacing;
  lattice.extent_ = source.extent();
  if (!(spacing > 0.0)) return lattice;

  const Extent& ext = lattice.extent_;
  for (double x = ext.x_min + spacing * 0.5; x < ext.x_max; x += spacing) {
    lattice.xs_.push_back(x);
  }
  for (double y = ext.y_min + spacing * 0.5; y < ext.y_max; y += spacing) {
    lattice.ys_.push_back(y);
  }

  const size_t total = lattice.xs_.size() * lattice.ys_.size();
  lattice.elevation_.assign(total, 0.0);
  lattice.present_.assign(total, 0);

  bool first = true;
  for (int c = 0; c < lattice.cols(); ++c) {
    token.throwIfCancelled("lattice sampling");
    for (int r = 0; r < lattice.rows(); ++r) {
      const auto z = source.sample({lattice.xs_[c], lattice.ys_[r]});
      if (!z) continue;
      const int k = lattice.key(c, r);
      lattice.elevation_[k] = *z;
      lattice.present_[k] = 1;
      lattice.nodes_.push_back(k);
      if (first) {
        lattice.min_elevation_ = lattice.max_elevation_ = *z;
        first = false;
      } else {
        lattice.min_elevation_ = std::min(lattice.min_elevation_, *z);
        lattice.max_elevation_ = std::max(lattice.max_elevation_, *z);
      }
    }
  }
  return lattice;
}

int GridLattice::neighbor(int key, int dc, int dr) const {
  const int c = col(key) + dc;
  const int r = row(key) + dr;
  if (c < 0 || r < 0 || c >= cols() || r >= rows()) return kNone;
  const int k = this->key(c, r);
  return present_[k] ? k : kNone;
}

}  // namespace geomancy
