// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/dem_raster.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace geomancy {

DemRaster::DemRaster(int rows, int cols, double resolution,
                     const Point2& origin, float fill)
    : data_(Eigen::MatrixXf::Constant(rows, cols, fill)),
      resolution_(resolution),
      origin_(origin) {
  if (rows < 0 || cols < 0) {
    throw std::invalid_argument("DemRaster: negative size");
  }
  if (!(resolution > 0.0)) {
    throw std::invalid_argument("DemRaster: resolution must be > 0");
  }
}

DemRaster::DemRaster(Eigen::MatrixXf data, double resolution,
                     const Point2& origin)
    : data_(std::move(data)), resolution_(resolution), origin_(origin) {
  if (!(resolution > 0.0)) {
    throw std::invalid_argument("DemRaster: resolution must be > 0");
  }
}

Extent DemRaster::extent() const {
  return {origin_.x(), origin_.y(), origin_.x() + cols() * resolution_,
          origin_.y() + rows() * resolution_};
}

Point2 DemRaster::pixelCenter(int row, int col) const {
  const Extent e = extent();
  return {e.x_min + (col + 0.5) * resolution_,
          e.y_max - (row + 0.5) * resolution_};
}

bool DemRaster::pixelIndex(const Point2& point, int& row, int& col) const {
  if (empty()) return false;
  const Extent e = extent();
  const double fc = std::floor((point.x() - e.x_min) / resolution_);
  const double fr = std::floor((e.y_max - point.y()) / resolution_);
  if (!std::isfinite(fc) || !std::isfinite(fr)) return false;
  if (fc < 0.0 || fr < 0.0 || fc >= cols() || fr >= rows()) return false;
  col = static_cast<int>(fc);
  row = static_cast<int>(fr);
  return true;
}

std::optional<double> DemRaster::sample(const Point2& point) const {
  int row = 0;
  int col = 0;
  if (!pixelIndex(point, row, col)) return std::nullopt;
  const float value = data_(row, col);
  if (!std::isfinite(value)) return std::nullopt;
  return static_cast<double>(value);
}

void DemRaster::fill(const std::function<float(const Point2&)>& fn) {
  for (int r = 0; r < rows(); ++r) {
    for (int c = 0; c < cols(); ++c) {
      data_(r, c) = fn(pixelCenter(r, c));
    }
  }
}

int DemRaster::validCount() const {
  int count = 0;
  for (int i = 0; i < data_.size(); ++i) {
    if (std::isfinite(data_.data()[i])) ++count;
  }
  return count;
}

}  // namespace geomancy
