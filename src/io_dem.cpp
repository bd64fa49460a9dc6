// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/io/dem.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "geomancy/io/ascii_grid.hpp"
#include "geomancy/io/npz.hpp"

namespace geomancy {
namespace io {

bool loadDem(const std::string& filename, DemRaster& dem) {
  const auto dot = filename.rfind('.');
  std::string ext = dot == std::string::npos ? "" : filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == "npz") return loadNpz(filename, dem);
  if (ext == "asc") return loadAsciiGrid(filename, dem);
  spdlog::error("[dem_io] Unsupported DEM format '{}' ({})", ext, filename);
  return false;
}

}  // namespace io
}  // namespace geomancy
