// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/io/sites.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geomancy {
namespace io {

namespace {

// Only trailing whitespace ('\r' from CRLF files) may follow the number.
void expectConsumed(const std::string& cell, size_t pos) {
  for (; pos < cell.size(); ++pos) {
    if (!std::isspace(static_cast<unsigned char>(cell[pos]))) {
      throw std::invalid_argument("trailing characters in '" + cell + "'");
    }
  }
}

int parseInt(const std::string& cell) {
  size_t pos = 0;
  const int value = std::stoi(cell, &pos);
  expectConsumed(cell, pos);
  return value;
}

double parseDouble(const std::string& cell) {
  size_t pos = 0;
  const double value = std::stod(cell, &pos);
  expectConsumed(cell, pos);
  return value;
}

bool isBlank(const std::string& cell) {
  for (char ch : cell) {
    if (!std::isspace(static_cast<unsigned char>(ch))) return false;
  }
  return true;
}

}  // namespace

bool loadSites(const std::string& filename, std::vector<Site>& sites) {
  std::ifstream fs(filename);
  if (!fs.is_open()) {
    spdlog::error("[sites_io] Cannot open {}", filename);
    return false;
  }

  std::vector<Site> loaded;
  std::string line;
  int line_no = 0;
  while (std::getline(fs, line)) {
    ++line_no;
    if (isBlank(line) || line[0] == '#') continue;
    std::vector<std::string> cells;
    std::stringstream ss(line);
    for (std::string cell; std::getline(ss, cell, ',');) cells.push_back(cell);
    if (cells.size() < 3) {
      if (line_no == 1) continue;
      spdlog::error("[sites_io] Line {} of {} has {} cells, need 3", line_no,
                    filename, cells.size());
      return false;
    }
    try {
      Site site;
      site.id = parseInt(cells[0]);
      site.point = Point2(parseDouble(cells[1]), parseDouble(cells[2]));
      if (cells.size() > 3 && !isBlank(cells[3])) site.slope_deg = parseDouble(cells[3]);
      if (cells.size() > 4 && !isBlank(cells[4])) site.aspect_deg = parseDouble(cells[4]);
      loaded.push_back(site);
    } catch (const std::exception& e) {
      if (line_no == 1) continue;  // header
      spdlog::error("[sites_io] Bad site line {} in {}: {}", line_no, filename,
                    e.what());
      return false;
    }
  }

  sites = std::move(loaded);
  spdlog::debug("[sites_io] Loaded {} sites from {}", sites.size(), filename);
  return true;
}

}  // namespace io
}  // namespace geomancy
