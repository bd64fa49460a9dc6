// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/io/ascii_grid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <optional>

namespace geomancy {
namespace io {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool isHeaderKey(const std::string& token) {
  return !token.empty() && std::isalpha(static_cast<unsigned char>(token[0]));
}

}  // namespace

bool loadAsciiGrid(const std::string& filename, DemRaster& dem) {
  std::ifstream fs(filename);
  if (!fs.is_open()) {
    spdlog::error("[asc_io] Cannot open {}", filename);
    return false;
  }

  std::map<std::string, double> header;
  std::string token;
  while (fs >> token) {
    if (!isHeaderKey(token)) break;
    double value = 0.0;
    if (!(fs >> value)) {
      spdlog::error("[asc_io] Missing value for '{}' in {}", token, filename);
      return false;
    }
    header[lower(token)] = value;
  }

  auto get = [&](const char* key) -> std::optional<double> {
    auto it = header.find(key);
    if (it == header.end()) return std::nullopt;
    return it->second;
  };
  const auto ncols = get("ncols");
  const auto nrows = get("nrows");
  const auto cellsize = get("cellsize");
  if (!ncols || !nrows || !cellsize || *ncols < 1 || *nrows < 1 ||
      *cellsize <= 0.0) {
    spdlog::error("[asc_io] Invalid or incomplete header in {}", filename);
    return false;
  }

  Point2 origin;
  if (get("xllcorner") && get("yllcorner")) {
    origin = {*get("xllcorner"), *get("yllcorner")};
  } else if (get("xllcenter") && get("yllcenter")) {
    origin = {*get("xllcenter") - 0.5 * *cellsize,
              *get("yllcenter") - 0.5 * *cellsize};
  } else {
    spdlog::error("[asc_io] Missing lower-left coordinates in {}", filename);
    return false;
  }
  const std::optional<double> nodata = get("nodata_value");

  const int rows = static_cast<int>(*nrows);
  const int cols = static_cast<int>(*ncols);
  Eigen::MatrixXf data(rows, cols);
  // `token` already holds the first value after the header
  bool have_token = !token.empty() && !isHeaderKey(token);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!have_token && !(fs >> token)) {
        spdlog::error("[asc_io] {} ends after {} of {} values", filename,
                      r * cols + c, rows * cols);
        return false;
      }
      have_token = false;
      double v = 0.0;
      try {
        v = std::stod(token);
      } catch (const std::exception&) {
        spdlog::error("[asc_io] Bad value '{}' in {}", token, filename);
        return false;
      }
      data(r, c) = (nodata && v == *nodata) ? NAN : static_cast<float>(v);
    }
  }

  dem = DemRaster(std::move(data), *cellsize, origin);
  return true;
}

bool saveAsciiGrid(const std::string& filename, const DemRaster& dem,
                   double nodata) {
  std::ofstream fs(filename);
  if (!fs.is_open()) {
    spdlog::error("[asc_io] Cannot create {}", filename);
    return false;
  }
  fs.precision(10);
  fs << "ncols " << dem.cols() << "\n"
     << "nrows " << dem.rows() << "\n"
     << "xllcorner " << dem.origin().x() << "\n"
     << "yllcorner " << dem.origin().y() << "\n"
     << "cellsize " << dem.resolution() << "\n"
     << "NODATA_value " << nodata << "\n";
  for (int r = 0; r < dem.rows(); ++r) {
    for (int c = 0; c < dem.cols(); ++c) {
      const float v = dem.at(r, c);
      if (c > 0) fs << ' ';
      if (std::isfinite(v)) {
        fs << v;
      } else {
        fs << nodata;
      }
    }
    fs << "\n";
  }
  if (fs.fail()) {
    spdlog::error("[asc_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

}  // namespace io
}  // namespace geomancy
