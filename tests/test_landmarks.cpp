// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_landmarks.cpp
 *
 * Tests for landmark derivation and structural linking.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <tuple>

#include "geomancy/dem_raster.hpp"
#include "geomancy/terms/landmark_deriver.hpp"
#include "geomancy/terms/structural_linker.hpp"

using namespace geomancy;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

const Point2 kCenter(100.0, 100.0);

Candidate flatCandidate(const Point2& point, double score) {
  Candidate c;
  c.point = point;
  c.elevation = 42.0;
  c.score = score;
  return c;
}

const LandmarkRecord* find(const LandmarkLayer& layer, const std::string& id,
                           int parent = 1) {
  for (const auto& rec : layer) {
    if (rec.term_id == id && rec.parent_id == parent) return &rec;
  }
  return nullptr;
}

LandmarkRecord landmark(const std::string& id, int parent, const Point2& p,
                        double score) {
  LandmarkRecord rec;
  rec.term_id = id;
  rec.parent_id = parent;
  rec.rank = parent;
  rec.point = p;
  rec.score = score;
  rec.culture = "korea";
  rec.period = "medieval";
  return rec;
}

class LandmarkDeriverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dem = DemRaster(200, 200, 1.0, Point2(0.0, 0.0), 42.0f);
    ctx = buildContext(cfg, "east_asia", "early_modern", Hemisphere::North);
  }

  DemRaster dem;
  Config cfg;
  CulturalContext ctx;
};

}  // namespace

// ─── Deriver ─────────────────────────────────────────────────────────────────

TEST_F(LandmarkDeriverTest, RadiiAndFloor) {
  LandmarkDeriver deriver(dem, cfg);
  auto r = deriver.radii(ctx);
  EXPECT_DOUBLE_EQ(r.inner, 18.0);
  EXPECT_DOUBLE_EQ(r.outer, 38.0);
  EXPECT_DOUBLE_EQ(r.far, 65.0);
  EXPECT_DOUBLE_EQ(r.of(RadiusClass::Far), 65.0);
  EXPECT_NEAR(deriver.scoreFloor(ctx), 0.62 * 0.72, 1e-12);
  // Flat ground still normalises by at least one metre
  EXPECT_DOUBLE_EQ(deriver.localRelief(kCenter, r.outer), 1.0);
}

TEST_F(LandmarkDeriverTest, StrongCandidateEmitsEveryTerm) {
  LandmarkDeriver deriver(dem, cfg);
  auto layer = deriver.derive({flatCandidate(kCenter, 0.9)}, ctx);

  EXPECT_EQ(layer.name(), "landmarks");
  EXPECT_EQ(layer.size(), 15u);
  ASSERT_GE(layer.size(), 2u);
  EXPECT_EQ(layer[0].term_id, term::core);
  EXPECT_EQ(layer[0].term_name, "Core Point");
  EXPECT_EQ(layer[1].term_id, term::basin);
  EXPECT_EQ(layer[1].mode, "refine");

  for (const auto& rec : layer) {
    EXPECT_EQ(rec.parent_id, 1);
    EXPECT_EQ(rec.culture, "east_asia");
    ASSERT_TRUE(rec.score);
    EXPECT_GE(*rec.score, 0.0);
    EXPECT_LE(*rec.score, 1.0);
    EXPECT_FALSE(rec.reason.empty());
  }

  const auto* back = find(layer, term::back_peak);
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(back->mode, "max");
  EXPECT_DOUBLE_EQ(*back->azimuth, 0.0);
  EXPECT_NEAR((back->point - kCenter).norm(), 38.0, 1e-9);
  EXPECT_DOUBLE_EQ(*back->delta_rel, 0.0);

  const auto* inflow = find(layer, term::inflow);
  ASSERT_NE(inflow, nullptr);
  EXPECT_FALSE(inflow->azimuth);
  EXPECT_EQ(inflow->mode, "min");
}

TEST_F(LandmarkDeriverTest, WeakCandidateKeepsCoreAndBasin) {
  LandmarkDeriver deriver(dem, cfg);
  auto layer = deriver.derive({flatCandidate(kCenter, 0.0)}, ctx);

  ASSERT_NE(find(layer, term::core), nullptr);
  ASSERT_NE(find(layer, term::basin), nullptr);
  EXPECT_EQ(find(layer, term::far_back_peak), nullptr);
  for (const auto& rec : layer) {
    if (rec.term_id == term::core || rec.term_id == term::basin) continue;
    EXPECT_GE(*rec.score, deriver.scoreFloor(ctx));
  }
}

TEST_F(LandmarkDeriverTest, RanksFollowCandidateOrder) {
  LandmarkDeriver deriver(dem, cfg);
  auto layer = deriver.derive(
      {flatCandidate(kCenter, 0.9), flatCandidate({120.0, 80.0}, 0.8)}, ctx);

  const auto* second = find(layer, term::core, 2);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->rank, 2);
  EXPECT_EQ(second->point, Point2(120.0, 80.0));
  EXPECT_EQ(second->reason.rfind("Core candidate #2/2.", 0), 0u);
}

TEST_F(LandmarkDeriverTest, TermBiasIsClamped) {
  ctx.term_bias[term::back_peak] = 5.0;
  LandmarkDeriver deriver(dem, cfg);
  auto layer = deriver.derive({flatCandidate(kCenter, 0.9)}, ctx);
  const auto* back = find(layer, term::back_peak);
  ASSERT_NE(back, nullptr);
  EXPECT_DOUBLE_EQ(*back->score, 1.0);
}

TEST_F(LandmarkDeriverTest, SouthHemisphereMirrorsDirections) {
  ctx = buildContext(cfg, "east_asia", "early_modern", Hemisphere::South);
  LandmarkDeriver deriver(dem, cfg);
  auto layer = deriver.derive({flatCandidate(kCenter, 0.9)}, ctx);
  const auto* basin = find(layer, term::basin);
  ASSERT_NE(basin, nullptr);
  EXPECT_DOUBLE_EQ(*basin->azimuth, 0.0);
  EXPECT_GT(basin->point.y(), kCenter.y());
}

TEST_F(LandmarkDeriverTest, EdgeCandidateSkipsMissingSectors) {
  LandmarkDeriver deriver(dem, cfg);
  // Far ring leaves the raster to the north
  auto layer = deriver.derive({flatCandidate({100.0, 190.0}, 0.9)}, ctx);
  EXPECT_EQ(find(layer, term::far_back_peak), nullptr);
  EXPECT_NE(find(layer, term::core), nullptr);
}

// ─── Linker ──────────────────────────────────────────────────────────────────

TEST(LinkPathTest, StraightAndBent) {
  auto straight = linkPath({0, 0}, {10, 0}, std::nullopt, 0.35);
  ASSERT_EQ(straight.size(), 2u);

  auto bent = linkPath({0, 0}, {10, 0}, Point2(5, 10), 0.5);
  ASSERT_EQ(bent.size(), 3u);
  EXPECT_NEAR(bent[1].x(), 5.0, 1e-12);
  EXPECT_NEAR(bent[1].y(), 5.0, 1e-12);
  EXPECT_EQ(bent.front(), Point2(0, 0));
  EXPECT_EQ(bent.back(), Point2(10, 0));
}

TEST(StructuralLinkerTest, LinksFollowPlan) {
  Config cfg;
  LandmarkLayer layer("landmarks");
  layer.append(landmark(term::core, 1, {0, 0}, 0.9));
  layer.append(landmark(term::back_peak, 1, {0, 40}, 0.8));
  layer.append(landmark(term::near_back_peak, 1, {0, 20}, 0.7));
  layer.append(landmark(term::left_inner, 1, {20, 0}, 0.9));

  auto links = StructuralLinker(cfg.links, cfg.terms).link(layer);
  EXPECT_EQ(links.name(), "structural_links");
  ASSERT_EQ(links.size(), 1u);
  const auto& e = links[0];
  EXPECT_EQ(e.src_id, term::back_peak);
  EXPECT_EQ(e.dst_id, term::near_back_peak);
  EXPECT_EQ(e.style_term, term::back_peak);
  EXPECT_EQ(e.style_name, "Main Mountain");
  EXPECT_NEAR(*e.score, 0.75, 1e-12);
  EXPECT_DOUBLE_EQ(e.length_m, 20.0);
  EXPECT_NEAR(e.azimuth, 180.0, 1e-9);
  EXPECT_TRUE(e.curved);
  EXPECT_EQ(e.path.size(), 3u);
  EXPECT_EQ(e.culture, "korea");
  EXPECT_NE(e.reason.find("shape=bent"), std::string::npos);
}

TEST(StructuralLinkerTest, StraightWithoutCoreOrWhenDisabled) {
  Config cfg;
  LandmarkLayer layer;
  layer.append(landmark(term::back_peak, 1, {0, 40}, 0.8));
  layer.append(landmark(term::near_back_peak, 1, {0, 20}, 0.7));

  auto no_core = StructuralLinker(cfg.links, cfg.terms).link(layer);
  ASSERT_EQ(no_core.size(), 1u);
  EXPECT_FALSE(no_core[0].curved);
  EXPECT_EQ(no_core[0].path.size(), 2u);

  layer.append(landmark(term::core, 1, {0, 0}, 0.9));
  cfg.links.curved = false;
  auto disabled = StructuralLinker(cfg.links, cfg.terms).link(layer);
  ASSERT_EQ(disabled.size(), 1u);
  EXPECT_FALSE(disabled[0].curved);
}

TEST(StructuralLinkerTest, DropsWeakAndCoincidentLinks) {
  Config cfg;
  LandmarkLayer layer;
  layer.append(landmark(term::back_peak, 1, {0, 40}, 0.3));
  layer.append(landmark(term::near_back_peak, 1, {0, 20}, 0.4));
  layer.append(landmark(term::left_inner, 1, {20, 0}, 0.9));
  layer.append(landmark(term::left_outer, 1, {20, 0}, 0.9));

  auto links = StructuralLinker(cfg.links, cfg.terms).link(layer);
  EXPECT_TRUE(links.empty());
}

TEST(StructuralLinkerTest, GroupsByParentAndLaterTermWins) {
  Config cfg;
  LandmarkLayer layer;
  layer.append(landmark(term::near_outlet, 2, {0, -20}, 0.8));
  layer.append(landmark(term::far_outlet, 2, {0, -40}, 0.8));
  layer.append(landmark(term::back_peak, 1, {0, 40}, 0.8));
  layer.append(landmark(term::near_back_peak, 1, {0, 20}, 0.8));
  layer.append(landmark(term::far_outlet, 2, {0, -60}, 0.8));

  auto links = StructuralLinker(cfg.links, cfg.terms).link(layer);
  ASSERT_EQ(links.size(), 2u);
  // First-seen parent comes first
  EXPECT_EQ(links[0].parent_id, 2);
  EXPECT_DOUBLE_EQ(links[0].length_m, 40.0);
  EXPECT_EQ(links[1].parent_id, 1);

  std::set<std::tuple<int, std::string, std::string>> unique;
  for (const auto& e : links) {
    EXPECT_TRUE(unique.emplace(e.parent_id, std::min(e.src_id, e.dst_id),
                               std::max(e.src_id, e.dst_id))
                    .second);
  }
}

TEST(StructuralLinkerTest, DuplicatePlanEntryLinksOnce) {
  Config cfg;
  cfg.links.plan = {{term::back_peak, term::near_back_peak, term::back_peak},
                    {term::near_back_peak, term::back_peak, term::back_peak}};
  LandmarkLayer layer;
  layer.append(landmark(term::back_peak, 1, {0, 40}, 0.8));
  layer.append(landmark(term::near_back_peak, 1, {0, 20}, 0.8));

  auto links = StructuralLinker(cfg.links, cfg.terms).link(layer);
  EXPECT_EQ(links.size(), 1u);
}
