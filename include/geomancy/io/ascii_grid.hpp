// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_IO_ASCII_GRID_HPP
#define GEOMANCY_IO_ASCII_GRID_HPP

#include <string>

#include "geomancy/dem_raster.hpp"

namespace geomancy {
namespace io {

/// Load an ESRI ASCII grid (.asc). NODATA_value cells become NaN.
/// Both xllcorner/yllcorner and xllcenter/yllcenter are accepted.
bool loadAsciiGrid(const std::string& filename, DemRaster& dem);

/// Save as ESRI ASCII grid with corner registration.
bool saveAsciiGrid(const std::string& filename, const DemRaster& dem,
                   double nodata = -9999.0);

}  // namespace io
}  // namespace geomancy

#endif  // GEOMANCY_IO_ASCII_GRID_HPP
