// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * npz.hpp
 *
 * NumPy .npz format for lossless DemRaster serialization.
 * Compatible with numpy.load() / numpy.savez() in Python.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_IO_NPZ_HPP
#define GEOMANCY_IO_NPZ_HPP

#include <string>

#include "geomancy/dem_raster.hpp"

namespace geomancy {
namespace io {

/// Save elevation (float32, row 0 = north) + metadata as .npz archive.
bool saveNpz(const std::string& filename, const DemRaster& dem);

/// Load a DemRaster saved by saveNpz.
bool loadNpz(const std::string& filename, DemRaster& dem);

}  // namespace io
}  // namespace geomancy

#endif  // GEOMANCY_IO_NPZ_HPP
