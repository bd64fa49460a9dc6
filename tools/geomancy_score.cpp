// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geomancy_score: Score candidate sites against a DEM.
 *
 * Sites are read from CSV lines "id,x,y[,slope_deg,aspect_deg]"; a header
 * line is skipped. Without a water file the drainage network derived from
 * the DEM is used as water.
 *
 * Usage:
 *   ./geomancy_score dem.(asc|npz) sites.csv output.geojson [profile]
 *                    [culture] [period] [north|south] [config.yaml]
 *                    [--verbose]
 *
 * Example:
 *   ./geomancy_score valley.asc sites.csv scores.geojson settlement
 */

#include <geomancy/analyzer.hpp>
#include <geomancy/dem_raster.hpp>
#include <geomancy/io/dem.hpp>
#include <geomancy/io/geojson.hpp>
#include <geomancy/io/sites.hpp>
#include <spdlog/spdlog.h>

#include <exception>
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
  if (args.size() < 3) {
    std::cerr << "Usage: geomancy_score <dem.asc|dem.npz> <sites.csv> "
                 "<output.geojson> [profile] [culture] [period] "
                 "[north|south] [config.yaml] [--verbose]\n";
    return 1;
  }

  RunOptions options;
  options.auto_hydro = true;
  if (args.size() >= 4) options.profile = args[3];
  if (args.size() >= 5) options.culture = args[4];
  if (args.size() >= 6) options.period = args[5];
  if (args.size() >= 7) {
    const auto h = parseHemisphere(args[6]);
    if (!h) {
      std::cerr << "Unknown hemisphere '" << args[6] << "'\n";
      return 1;
    }
    options.hemisphere = *h;
  }

  Config cfg;
  try {
    if (args.size() >= 8) cfg = loadConfig(args[7]);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  auto dem = std::make_shared<DemRaster>();
  if (!io::loadDem(args[0], *dem)) return 1;

  std::vector<Site> sites;
  if (!io::loadSites(args[1], sites)) return 1;
  std::cout << "Scoring " << sites.size() << " sites ..." << std::endl;

  Analyzer analyzer(dem, cfg);
  auto scores = analyzer.scoreSites(sites, options);
  if (!scores.ok()) {
    std::cerr << "Scoring " << toString(scores.status) << ": "
              << scores.message << "\n";
    return 1;
  }

  for (const auto& rec : scores.value) {
    std::cout << "  #" << rec.site_id << " score=" << formatScore(rec.score, 2)
              << " conf=" << formatScore(rec.confidence) << " " << rec.note
              << std::endl;
  }

  if (!io::saveGeoJson(args[2], scores.value)) return 1;
  std::cout << "Saved to " << args[2] << std::endl;
  return 0;
}
