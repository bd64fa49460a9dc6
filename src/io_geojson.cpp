// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/io/geojson.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>

namespace geomancy {
namespace io {
namespace detail {

namespace {

std::string quote(const std::string& s) {
  std::string out = "\"";
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<int>(c));
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

std::string formatValue(const FieldSpec& spec, const FieldValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) return quote(*s);
  if (const auto* i = std::get_if<int>(&value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&value)) {
    if (!std::isfinite(*d)) return "null";
    if (spec.precision > 0) return fmt::format("{:.{}f}", *d, spec.precision);
    return fmt::format("{}", *d);
  }
  return "null";
}

std::string formatPosition(const Point2& p) {
  return fmt::format("[{}, {}]", p.x(), p.y());
}

std::string formatGeometry(GeometryType type, const Polyline& geometry) {
  if (geometry.empty()) return "null";
  if (type == GeometryType::Point) {
    return "{\"type\": \"Point\", \"coordinates\": " +
           formatPosition(geometry.front()) + "}";
  }
  std::string coords;
  for (size_t i = 0; i < geometry.size(); ++i) {
    if (i > 0) coords += ", ";
    coords += formatPosition(geometry[i]);
  }
  return "{\"type\": \"LineString\", \"coordinates\": [" + coords + "]}";
}

}  // namespace

std::string formatGeoJson(const std::string& name, GeometryType type,
                          const Schema& schema,
                          const std::vector<GeoJsonFeature>& features) {
  std::string out = "{\"type\": \"FeatureCollection\", \"name\": " +
                    quote(name) + ", \"features\": [";
  for (size_t f = 0; f < features.size(); ++f) {
    const auto& feature = features[f];
    out += f > 0 ? ",\n" : "\n";
    out += "{\"type\": \"Feature\", \"properties\": {";
    for (size_t i = 0; i < schema.size() && i < feature.values.size(); ++i) {
      if (i > 0) out += ", ";
      out += quote(schema[i].name) + ": " +
             formatValue(schema[i], feature.values[i]);
    }
    out += "}, \"geometry\": " + formatGeometry(type, feature.geometry) + "}";
  }
  out += "\n]}\n";
  return out;
}

bool writeTextFile(const std::string& filename, const std::string& text) {
  std::ofstream fs(filename);
  if (!fs.is_open()) {
    spdlog::error("[geojson_io] Cannot create {}", filename);
    return false;
  }
  fs << text;
  if (fs.fail()) {
    spdlog::error("[geojson_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

}  // namespace detail
}  // namespace io
}  // namespace geomancy
