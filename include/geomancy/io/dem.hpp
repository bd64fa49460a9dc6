// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_IO_DEM_HPP
#define GEOMANCY_IO_DEM_HPP

#include <string>

#include "geomancy/dem_raster.hpp"

namespace geomancy {
namespace io {

/// Load a DEM by extension: .npz (saveNpz layout) or .asc (ESRI ASCII).
bool loadDem(const std::string& filename, DemRaster& dem);

}  // namespace io
}  // namespace geomancy

#endif  // GEOMANCY_IO_DEM_HPP
