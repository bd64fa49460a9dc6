// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "geomancy/layers.hpp"

using namespace geomancy;

namespace {

template <typename Record>
void expectArityMatches() {
  Record rec;
  EXPECT_EQ(rec.values().size(), Record::schema().size());
  EXPECT_NO_THROW(validateSchema(Record::schema()));
  EXPECT_NO_THROW(checkValues(Record::schema(), rec.values()));
}

}  // namespace

// ─── Schema ─────────────────────────────────────────────────────────────────

TEST(SchemaTest, RecordsMatchTheirSchemas) {
  expectArityMatches<SiteScoreRecord>();
  expectArityMatches<LandmarkRecord>();
  expectArityMatches<StructuralEdgeRecord>();
  expectArityMatches<DrainagePathRecord>();
  expectArityMatches<RidgePathRecord>();
}

TEST(SchemaTest, SiteScoreFieldOrder) {
  const auto& s = SiteScoreRecord::schema();
  ASSERT_EQ(s.size(), 19u);
  EXPECT_EQ(s.front().name, "site_id");
  EXPECT_EQ(s[1].name, "fs_culture");
  EXPECT_EQ(s[16].name, "fs_score");
  EXPECT_EQ(s.back().name, "fs_aspect_deg");
  EXPECT_EQ(s[16].type, FieldType::Double);
  EXPECT_EQ(s[16].precision, 2);
}

TEST(SchemaTest, EdgeCurvedIsInteger) {
  const auto& s = StructuralEdgeRecord::schema();
  ASSERT_EQ(s.size(), 13u);
  EXPECT_EQ(s[11].name, "curved");
  EXPECT_EQ(s[11].type, FieldType::Int);

  StructuralEdgeRecord rec;
  rec.curved = true;
  EXPECT_EQ(std::get<int>(rec.values()[11]), 1);
}

TEST(SchemaTest, EmptyNameRejected) {
  Schema s = {{"a", FieldType::Int, 10, 0}, {"", FieldType::Int, 10, 0}};
  EXPECT_THROW(validateSchema(s), std::logic_error);
}

TEST(SchemaTest, DuplicateNameRejected) {
  Schema s = {{"a", FieldType::Int, 10, 0}, {"a", FieldType::Double, 7, 3}};
  EXPECT_THROW(validateSchema(s), std::logic_error);
}

// ─── Values ─────────────────────────────────────────────────────────────────

TEST(ValuesTest, ArityMismatchRejected) {
  Schema s = {{"a", FieldType::Int, 10, 0}, {"b", FieldType::String, 8, 0}};
  EXPECT_THROW(checkValues(s, {1}), std::logic_error);
  EXPECT_THROW(checkValues(s, {1, std::string("x"), 2.0}), std::logic_error);
}

TEST(ValuesTest, TypeMismatchRejected) {
  Schema s = {{"a", FieldType::Int, 10, 0}, {"b", FieldType::String, 8, 0}};
  EXPECT_NO_THROW(checkValues(s, {1, std::string("x")}));
  EXPECT_THROW(checkValues(s, {1.5, std::string("x")}), std::logic_error);
  EXPECT_THROW(checkValues(s, {1, 2}), std::logic_error);
}

TEST(ValuesTest, NullMatchesAnyType) {
  Schema s = {{"a", FieldType::Int, 10, 0},
              {"b", FieldType::String, 8, 0},
              {"c", FieldType::Double, 7, 3}};
  EXPECT_NO_THROW(
      checkValues(s, {std::monostate{}, std::monostate{}, std::monostate{}}));
}

TEST(ValuesTest, ScoreToField) {
  EXPECT_TRUE(std::holds_alternative<std::monostate>(toField(Score{})));
  EXPECT_DOUBLE_EQ(std::get<double>(toField(Score{0.25})), 0.25);
}

// ─── Layer ──────────────────────────────────────────────────────────────────

TEST(LayerTest, AppendAndIterate) {
  SiteScoreLayer layer("site_scores");
  EXPECT_TRUE(layer.empty());
  EXPECT_EQ(layer.name(), "site_scores");
  EXPECT_EQ(SiteScoreLayer::geometryType(), GeometryType::Point);

  for (int i = 1; i <= 3; ++i) {
    SiteScoreRecord rec;
    rec.site_id = i;
    rec.point = Point2(1.0 * i, -1.0 * i);
    rec.score = 0.1 * i;
    layer.append(rec);
  }

  ASSERT_EQ(layer.size(), 3u);
  EXPECT_EQ(layer[1].site_id, 2);
  int sum = 0;
  for (const auto& rec : layer) sum += rec.site_id;
  EXPECT_EQ(sum, 6);

  const auto geom = layer[2].geometry();
  ASSERT_EQ(geom.size(), 1u);
  EXPECT_DOUBLE_EQ(geom[0].x(), 3.0);
}

TEST(LayerTest, LineLayersUseLineStrings) {
  EXPECT_EQ(LinkLayer::geometryType(), GeometryType::LineString);
  EXPECT_EQ(DrainageLayer::geometryType(), GeometryType::LineString);
  EXPECT_EQ(RidgeLayer::geometryType(), GeometryType::LineString);
  EXPECT_EQ(LandmarkLayer::geometryType(), GeometryType::Point);
}

TEST(LayerTest, Rename) {
  RidgeLayer layer;
  EXPECT_TRUE(layer.name().empty());
  layer.setName("ridges");
  EXPECT_EQ(layer.name(), "ridges");
}
