// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/layers.hpp"

#include <set>
#include <stdexcept>

namespace geomancy {

namespace {

FieldSpec str(const char* name, int length) {
  return {name, FieldType::String, length, 0};
}
FieldSpec integer(const char* name) { return {name, FieldType::Int, 10, 0}; }
FieldSpec real(const char* name, int length, int precision) {
  return {name, FieldType::Double, length, precision};
}

bool matches(FieldType type, const FieldValue& value) {
  if (std::holds_alternative<std::monostate>(value)) return true;
  switch (type) {
    case FieldType::String:
      return std::holds_alternative<std::string>(value);
    case FieldType::Int:
      return std::holds_alternative<int>(value);
    case FieldType::Double:
      return std::holds_alternative<double>(value);
  }
  return false;
}

}  // namespace

void validateSchema(const Schema& schema) {
  std::set<std::string> names;
  for (const auto& field : schema) {
    if (field.name.empty()) {
      throw std::logic_error("schema field without a name");
    }
    if (!names.insert(field.name).second) {
      throw std::logic_error("duplicate schema field '" + field.name + "'");
    }
  }
}

void checkValues(const Schema& schema, const FieldValues& values) {
  if (values.size() != schema.size()) {
    throw std::logic_error("record has " + std::to_string(values.size()) +
                           " values, schema declares " +
                           std::to_string(schema.size()));
  }
  for (size_t i = 0; i < schema.size(); ++i) {
    if (!matches(schema[i].type, values[i])) {
      throw std::logic_error("type mismatch in field '" + schema[i].name + "'");
    }
  }
}

// ─── Site scores ────────────────────────────────────────────────────────────

const Schema& SiteScoreRecord::schema() {
  static const Schema s = {
      integer("site_id"),        str("fs_culture", 20),
      str("fs_period", 20),      str("fs_model", 24),
      real("fs_conf", 6, 3),     str("fs_note", 80),
      str("fs_reason", 254),     real("fs_water_m", 12, 3),
      real("fs_slope", 6, 3),    real("fs_aspect", 6, 3),
      real("fs_form", 6, 3),     real("fs_long", 6, 3),
      real("fs_demwtr", 6, 3),   real("fs_tpi", 7, 4),
      real("fs_conv", 6, 3),     real("fs_water", 6, 3),
      real("fs_score", 7, 2),    real("fs_slope_deg", 7, 2),
      real("fs_aspect_deg", 7, 2),
  };
  return s;
}

FieldValues SiteScoreRecord::values() const {
  return {site_id,          culture,          period,
          model,            toField(confidence), note,
          reason,           toField(water_m), toField(slope),
          toField(aspect),  toField(form),    toField(longitudinal),
          toField(dem_water), toField(tpi),   toField(conv),
          toField(water),   toField(score),   toField(slope_deg),
          toField(aspect_deg)};
}

// ─── Landmarks ──────────────────────────────────────────────────────────────

const Schema& LandmarkRecord::schema() {
  static const Schema s = {
      str("term_id", 28),       str("term_name", 28),
      str("culture", 20),       str("period", 20),
      integer("parent_id"),     integer("rank"),
      real("score", 7, 3),      real("elev", 12, 3),
      real("base_sc", 7, 3),    real("delta_rel", 8, 4),
      real("target_rel", 8, 4), real("fit_sc", 7, 3),
      real("radius_m", 12, 3),  real("azimuth", 7, 2),
      str("mode", 8),           real("relief_m", 12, 3),
      str("note", 80),          str("reason", 1024),
  };
  return s;
}

FieldValues LandmarkRecord::values() const {
  return {term_id,           term_name,         culture,
          period,            parent_id,         rank,
          toField(score),    elevation,         toField(base_score),
          toField(delta_rel), toField(target_rel), toField(fit_score),
          toField(radius_m), toField(azimuth),  mode,
          toField(relief_m), note,              reason};
}

// ─── Structural links ───────────────────────────────────────────────────────

const Schema& StructuralEdgeRecord::schema() {
  static const Schema s = {
      str("term_id", 28),  str("term_name", 28), integer("parent_id"),
      integer("rank"),     real("score", 7, 3),  str("culture", 20),
      str("period", 20),   str("src_id", 28),    str("dst_id", 28),
      real("len_m", 12, 3), real("azimuth", 7, 2), integer("curved"),
      str("reason", 1024),
  };
  return s;
}

FieldValues StructuralEdgeRecord::values() const {
  return {style_term, style_name, parent_id, rank,    toField(score),
          culture,    period,     src_id,    dst_id,  length_m,
          azimuth,    curved ? 1 : 0,        reason};
}

// ─── Drainage ───────────────────────────────────────────────────────────────

const Schema& DrainagePathRecord::schema() {
  static const Schema s = {
      integer("stream_id"),   real("flow_acc", 12, 3), real("acc_thr", 12, 3),
      real("keep_q", 6, 3),   real("min_len", 12, 3),  integer("min_ord"),
      integer("node_cnt"),    integer("order"),        str("stream_class", 16),
      real("len", 12, 3),     str("reason", 254),
  };
  return s;
}

FieldValues DrainagePathRecord::values() const {
  return {stream_id,  flow_acc,   acc_threshold, keep_quantile,
          min_length, min_order,  node_count,    order,
          stream_class, length,   reason};
}

// ─── Ridges ─────────────────────────────────────────────────────────────────

const Schema& RidgePathRecord::schema() {
  static const Schema s = {
      integer("ridge_id"),       real("strength", 7, 3),
      integer("ridge_rank"),     str("ridge_class", 16),
      real("ridge_score", 7, 3), real("elev_a", 12, 3),
      real("elev_b", 12, 3),     real("len", 12, 3),
      str("reason", 254),
  };
  return s;
}

FieldValues RidgePathRecord::values() const {
  return {ridge_id,    strength, rank,   ridge_class, ridge_score,
          elev_a,      elev_b,   length, reason};
}

}  // namespace geomancy
