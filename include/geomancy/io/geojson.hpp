// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geojson.hpp
 *
 * GeoJSON FeatureCollection export of produced layers.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_IO_GEOJSON_HPP
#define GEOMANCY_IO_GEOJSON_HPP

#include <string>
#include <vector>

#include "geomancy/layers.hpp"

namespace geomancy {
namespace io {

namespace detail {

struct GeoJsonFeature {
  Polyline geometry;
  FieldValues values;
};

std::string formatGeoJson(const std::string& name, GeometryType type,
                          const Schema& schema,
                          const std::vector<GeoJsonFeature>& features);

bool writeTextFile(const std::string& filename, const std::string& text);

}  // namespace detail

/// FeatureCollection text; doubles are rounded to the field precision and
/// null or non-finite values are written as null.
template <typename Record>
std::string toGeoJson(const Layer<Record>& layer) {
  std::vector<detail::GeoJsonFeature> features;
  features.reserve(layer.size());
  for (const auto& rec : layer) {
    features.push_back({rec.geometry(), rec.values()});
  }
  return detail::formatGeoJson(layer.name(), Layer<Record>::geometryType(),
                               Layer<Record>::schema(), features);
}

template <typename Record>
bool saveGeoJson(const std::string& filename, const Layer<Record>& layer) {
  return detail::writeTextFile(filename, toGeoJson(layer));
}

}  // namespace io
}  // namespace geomancy

#endif  // GEOMANCY_IO_GEOJSON_HPP
