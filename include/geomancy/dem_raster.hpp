// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * dem_raster.hpp
 *
 * In-memory north-up elevation raster backed by an Eigen matrix.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_DEM_RASTER_HPP
#define GEOMANCY_DEM_RASTER_HPP

#include <Eigen/Core>
#include <functional>
#include <string>

#include "geomancy/elevation_source.hpp"

namespace geomancy {

/**
 * @brief Square-pixel DEM with NaN as nodata.
 *
 * Row 0 is the northern edge, column 0 the western edge. Pixel (r, c)
 * covers [x_min + c*res, x_min + (c+1)*res) in x and
 * (y_max - (r+1)*res, y_max - r*res] in y; sampling is nearest-pixel.
 */
class DemRaster : public ElevationSource {
 public:
  DemRaster() = default;

  /// @param origin Lower-left (south-west) corner of the raster [m]
  DemRaster(int rows, int cols, double resolution, const Point2& origin,
            float fill = NAN);

  /// Wrap an existing matrix (row 0 = north).
  DemRaster(Eigen::MatrixXf data, double resolution, const Point2& origin);

  std::optional<double> sample(const Point2& point) const override;
  double pixelSizeX() const override { return resolution_; }
  double pixelSizeY() const override { return resolution_; }
  Extent extent() const override;

  int rows() const { return static_cast<int>(data_.rows()); }
  int cols() const { return static_cast<int>(data_.cols()); }
  double resolution() const { return resolution_; }
  const Point2& origin() const { return origin_; }
  bool empty() const { return data_.size() == 0; }

  Eigen::MatrixXf& data() { return data_; }
  const Eigen::MatrixXf& data() const { return data_; }

  float& at(int row, int col) { return data_(row, col); }
  float at(int row, int col) const { return data_(row, col); }

  /// Planar centre of pixel (row, col).
  Point2 pixelCenter(int row, int col) const;

  /// Pixel containing `point`. False when outside the raster.
  bool pixelIndex(const Point2& point, int& row, int& col) const;

  /// Set every pixel from its centre coordinate.
  void fill(const std::function<float(const Point2&)>& fn);

  /// Number of finite pixels.
  int validCount() const;

 private:
  Eigen::MatrixXf data_;
  double resolution_ = 1.0;
  Point2 origin_ = Point2::Zero();
};

}  // namespace geomancy

#endif  // GEOMANCY_DEM_RASTER_HPP
