// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cell_hash.hpp
 *
 * Hash utilities for integer 2D cell indices used as unordered_map keys.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_SPATIAL_CELL_HASH_HPP
#define GEOMANCY_SPATIAL_CELL_HASH_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include <Eigen/Core>

#include "geomancy/point_types.hpp"

namespace geomancy {

using CellIndex = Eigen::Vector2i;

struct CellHash {
  std::size_t operator()(const CellIndex& idx) const {
    const auto key =
        (static_cast<uint64_t>(static_cast<uint32_t>(idx(0))) << 32) |
        static_cast<uint64_t>(static_cast<uint32_t>(idx(1)));
    return std::hash<uint64_t>()(key);
  }
};

struct CellEqual {
  bool operator()(const CellIndex& a, const CellIndex& b) const {
    return a(0) == b(0) && a(1) == b(1);
  }
};

template <typename T>
using CellMap = std::unordered_map<CellIndex, T, CellHash, CellEqual>;

/// Bucket of a planar point for square cells of size `cell_size`.
inline CellIndex cellOf(const Point2& p, double cell_size) {
  return {static_cast<int>(std::floor(p.x() / cell_size)),
          static_cast<int>(std::floor(p.y() / cell_size))};
}

}  // namespace geomancy

#endif  // GEOMANCY_SPATIAL_CELL_HASH_HPP
