// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_IO_SITES_HPP
#define GEOMANCY_IO_SITES_HPP

#include <string>
#include <vector>

#include "geomancy/analyzer.hpp"

namespace geomancy {
namespace io {

/// Load sites from CSV lines "id,x,y[,slope_deg,aspect_deg]".
/// Blank lines and '#' comments are skipped, as is a non-numeric first
/// line (header). Any other unparsable cell fails the whole load.
bool loadSites(const std::string& filename, std::vector<Site>& sites);

}  // namespace io
}  // namespace geomancy

#endif  // GEOMANCY_IO_SITES_HPP
