// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * layers.hpp
 *
 * Typed feature records of the produced layers and their field schemas.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_LAYERS_HPP
#define GEOMANCY_LAYERS_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "geomancy/point_types.hpp"
#include "geomancy/score.hpp"

namespace geomancy {

enum class FieldType { String, Int, Double };

/// Declared attribute column: name, type, width and decimal precision.
struct FieldSpec {
  std::string name;
  FieldType type = FieldType::Double;
  int length = 0;
  int precision = 0;
};

using Schema = std::vector<FieldSpec>;

/// Attribute value; monostate is a null.
using FieldValue = std::variant<std::monostate, std::string, int, double>;
using FieldValues = std::vector<FieldValue>;

enum class GeometryType { Point, LineString };

inline FieldValue toField(const Score& value) {
  return value ? FieldValue(*value) : FieldValue();
}

/// @throws std::logic_error on empty or duplicate field names
void validateSchema(const Schema& schema);

/// @throws std::logic_error if the values do not match the schema
void checkValues(const Schema& schema, const FieldValues& values);

// ─── Records ────────────────────────────────────────────────────────────────

/// Scored input site with the fs_ attribute set.
struct SiteScoreRecord {
  static constexpr GeometryType kGeometry = GeometryType::Point;
  static const Schema& schema();

  int site_id = 0;
  Point2 point = Point2::Zero();
  std::string culture;
  std::string period;
  std::string model;
  Score confidence;
  std::string note;
  std::string reason;
  Score water_m;
  Score slope;
  Score aspect;
  Score form;
  Score longitudinal;
  Score dem_water;
  Score tpi;
  Score conv;
  Score water;
  Score score;
  Score slope_deg;
  Score aspect_deg;

  Polyline geometry() const { return {point}; }
  FieldValues values() const;
};

/// Named landmark around a candidate.
struct LandmarkRecord {
  static constexpr GeometryType kGeometry = GeometryType::Point;
  static const Schema& schema();

  std::string term_id;
  std::string term_name;
  std::string culture;
  std::string period;
  int parent_id = 0;
  int rank = 0;
  Point2 point = Point2::Zero();
  Score score;
  double elevation = 0.0;
  Score base_score;
  Score delta_rel;
  Score target_rel;
  Score fit_score;
  Score radius_m;
  Score azimuth;
  std::string mode;
  Score relief_m;
  std::string note;
  std::string reason;

  Polyline geometry() const { return {point}; }
  FieldValues values() const;
};

/// Structural link between two landmarks of the same candidate.
struct StructuralEdgeRecord {
  static constexpr GeometryType kGeometry = GeometryType::LineString;
  static const Schema& schema();

  std::string style_term;
  std::string style_name;
  int parent_id = 0;
  int rank = 0;
  Score score;
  std::string culture;
  std::string period;
  std::string src_id;
  std::string dst_id;
  double length_m = 0.0;
  double azimuth = 0.0;
  bool curved = false;
  Polyline path;
  std::string reason;

  Polyline geometry() const { return path; }
  FieldValues values() const;
};

/// Traced drainage line.
struct DrainagePathRecord {
  static constexpr GeometryType kGeometry = GeometryType::LineString;
  static const Schema& schema();

  int stream_id = 0;
  double flow_acc = 0.0;
  double acc_threshold = 0.0;
  double keep_quantile = 0.0;
  double min_length = 0.0;
  int min_order = 0;
  int node_count = 0;
  int order = 0;
  std::string stream_class;
  double length = 0.0;
  Polyline points;
  std::vector<int> nodes;  ///< Lattice keys along the path
  std::string reason;

  Polyline geometry() const { return points; }
  FieldValues values() const;
};

/// Traced and ranked ridge line.
struct RidgePathRecord {
  static constexpr GeometryType kGeometry = GeometryType::LineString;
  static const Schema& schema();

  int ridge_id = 0;
  double strength = 0.0;
  int rank = 0;
  std::string ridge_class;
  double ridge_score = 0.0;
  double elev_a = 0.0;
  double elev_b = 0.0;
  double length = 0.0;
  Polyline points;
  std::vector<int> nodes;
  std::string reason;

  Polyline geometry() const { return points; }
  FieldValues values() const;
};

// ─── Layer ──────────────────────────────────────────────────────────────────

/**
 * @brief In-memory feature collection of one record kind.
 *
 * The record schema is validated once per kind; every append checks the
 * record's values against it.
 */
template <typename Record>
class Layer {
 public:
  using RecordType = Record;

  explicit Layer(std::string name = {}) : name_(std::move(name)) {
    static const bool schema_ok = (validateSchema(Record::schema()), true);
    (void)schema_ok;
  }

  void append(Record record) {
    checkValues(Record::schema(), record.values());
    records_.push_back(std::move(record));
  }

  const std::string& name() const { return name_; }
  void setName(std::string name) { name_ = std::move(name); }

  static const Schema& schema() { return Record::schema(); }
  static constexpr GeometryType geometryType() { return Record::kGeometry; }

  const std::vector<Record>& features() const { return records_; }
  const Record& operator[](size_t i) const { return records_[i]; }
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  typename std::vector<Record>::const_iterator begin() const {
    return records_.begin();
  }
  typename std::vector<Record>::const_iterator end() const {
    return records_.end();
  }

 private:
  std::string name_;
  std::vector<Record> records_;
};

using SiteScoreLayer = Layer<SiteScoreRecord>;
using LandmarkLayer = Layer<LandmarkRecord>;
using LinkLayer = Layer<StructuralEdgeRecord>;
using DrainageLayer = Layer<DrainagePathRecord>;
using RidgeLayer = Layer<RidgePathRecord>;

}  // namespace geomancy

#endif  // GEOMANCY_LAYERS_HPP
