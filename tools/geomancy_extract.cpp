// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geomancy_extract: Landmarks, structural links, drainage and ridge lines
 * from a DEM, written as GeoJSON.
 *
 * Usage:
 *   ./geomancy_extract dem.(asc|npz) output_dir [culture] [period]
 *                      [north|south] [config.yaml] [--verbose]
 *
 * Example:
 *   ./geomancy_extract valley.asc out east_asia early_modern north
 */

#include <geomancy/analyzer.hpp>
#include <geomancy/dem_raster.hpp>
#include <geomancy/io/dem.hpp>
#include <geomancy/io/geojson.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace geomancy;

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose") {
      spdlog::set_level(spdlog::level::debug);
    } else {
      args.push_back(arg);
    }
  }
  if (args.size() < 2) {
    std::cerr << "Usage: geomancy_extract <dem.asc|dem.npz> <output_dir> "
                 "[culture] [period] [north|south] [config.yaml] [--verbose]\n";
    return 1;
  }

  const std::string dem_path = args[0];
  const std::string out_dir = args[1];

  RunOptions options;
  if (args.size() >= 3) options.culture = args[2];
  if (args.size() >= 4) options.period = args[3];
  if (args.size() >= 5) {
    const auto h = parseHemisphere(args[4]);
    if (!h) {
      std::cerr << "Unknown hemisphere '" << args[4] << "'\n";
      return 1;
    }
    options.hemisphere = *h;
  }

  Config cfg;
  try {
    if (args.size() >= 6) cfg = loadConfig(args[5]);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  // Load
  auto dem = std::make_shared<DemRaster>();
  std::cout << "Loading " << dem_path << " ..." << std::endl;
  if (!io::loadDem(dem_path, *dem)) return 1;
  std::cout << "  Grid: " << dem->rows() << " x " << dem->cols()
            << " cells, " << dem->validCount() << " valid" << std::endl;

  Analyzer analyzer(dem, cfg);

  // Landmarks and links
  auto terms = analyzer.extractTerms(options);
  if (!terms.ok()) {
    std::cerr << "Landmark extraction " << toString(terms.status) << ": "
              << terms.message << "\n";
    return 1;
  }
  auto links = analyzer.buildTermLinks(terms.value);
  if (!links.ok()) {
    std::cerr << "Linking " << toString(links.status) << ": " << links.message
              << "\n";
    return 1;
  }
  std::cout << "  " << terms.value.size() << " landmarks, "
            << links.value.size() << " links" << std::endl;

  // Networks
  auto drainage = analyzer.buildDrainageNetwork();
  auto ridges = analyzer.buildRidgeNetwork();
  if (!drainage.ok() || !ridges.ok()) {
    std::cerr << "Network extraction failed: " << drainage.message
              << ridges.message << "\n";
    return 1;
  }
  std::cout << "  " << drainage.value.size() << " streams, "
            << ridges.value.size() << " ridges" << std::endl;

  // Export
  const bool saved =
      io::saveGeoJson(out_dir + "/landmarks.geojson", terms.value) &&
      io::saveGeoJson(out_dir + "/links.geojson", links.value) &&
      io::saveGeoJson(out_dir + "/drainage.geojson", drainage.value) &&
      io::saveGeoJson(out_dir + "/ridges.geojson", ridges.value);
  if (!saved) return 1;
  std::cout << "Saved to " << out_dir << std::endl;

  return 0;
}
