// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * analyzer.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "geomancy/analyzer.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "geomancy/network/drainage_network.hpp"
#include "geomancy/network/ridge_network.hpp"
#include "geomancy/scoring/site_scorer.hpp"
#include "geomancy/search/candidate_search.hpp"
#include "geomancy/terms/landmark_deriver.hpp"
#include "geomancy/terms/structural_linker.hpp"

namespace geomancy {

namespace {

// Runs `fn` and maps engine exceptions onto the outcome status.
template <typename T, typename F>
Outcome<T> guarded(const char* operation, F&& fn) {
  try {
    return Outcome<T>::success(fn());
  } catch (const OperationCancelled& e) {
    spdlog::info("[Analyzer] {} {}", operation, e.what());
    return Outcome<T>::failure(Status::Cancelled, e.what());
  } catch (const std::exception& e) {
    spdlog::error("[Analyzer] {} failed: {}", operation, e.what());
    return Outcome<T>::failure(Status::Failed, e.what());
  }
}

template <typename T>
Outcome<T> invalid(const char* operation, const std::string& why) {
  spdlog::error("[Analyzer] {}: {}", operation, why);
  return Outcome<T>::failure(Status::InvalidInput, why);
}

}  // namespace

Analyzer::Analyzer(ElevationSource::ConstPtr dem, Config cfg)
    : dem_(std::move(dem)), cfg_(std::move(cfg)) {}

Analyzer& Analyzer::setWaterIndex(std::shared_ptr<const WaterIndex> water) {
  water_ = std::move(water);
  return *this;
}

std::string Analyzer::checkSource() const {
  if (!dem_) return "no elevation source";
  if (dem_->extent().isEmpty()) return "elevation source has an empty extent";
  return {};
}

CulturalContext Analyzer::context(const RunOptions& options) const {
  return buildContext(cfg_, options.culture, options.period,
                      options.hemisphere);
}

Outcome<SiteScoreLayer> Analyzer::scoreSites(
    const std::vector<Site>& sites, const RunOptions& options,
    const CancellationToken& token) const {
  constexpr const char* kOp = "scoreSites";
  if (auto why = checkSource(); !why.empty()) {
    return invalid<SiteScoreLayer>(kOp, why);
  }
  if (sites.empty()) return invalid<SiteScoreLayer>(kOp, "no sites given");
  if (cfg_.profiles.count(options.profile) == 0) {
    spdlog::warn("[Analyzer] Unknown profile '{}', using fallback",
                 options.profile);
  }

  return guarded<SiteScoreLayer>(kOp, [&] {
    const CulturalContext ctx = context(options);

    std::shared_ptr<const WaterIndex> water = water_;
    if (!water && options.auto_hydro) {
      DrainageNetworkBuilder builder(*dem_, cfg_);
      const DrainageLayer streams = builder.build(token);
      if (!streams.empty()) {
        water = std::make_shared<WaterIndex>(
            WaterIndex::fromDrainage(streams, builder.spacing() * 4.0));
      } else {
        spdlog::warn("[Analyzer] No drainage lines for auto hydro");
      }
    }

    const SiteScorer scorer(*dem_, cfg_, options.profile, ctx);
    SiteScoreLayer layer("site_scores");
    for (const auto& site : sites) {
      token.throwIfCancelled("site scoring");
      SiteInputs inputs;
      inputs.slope_deg = site.slope_deg;
      inputs.aspect_deg = site.aspect_deg;
      if (water) inputs.water_distance_m = water->nearestDistance(site.point);
      const SiteAssessment a = scorer.assess(site.point, inputs);

      SiteScoreRecord rec;
      rec.site_id = site.id;
      rec.point = site.point;
      rec.culture = ctx.culture_key;
      rec.period = ctx.period_key;
      rec.model = options.profile;
      rec.confidence = a.confidence;
      rec.note = a.note;
      rec.reason = a.reason;
      rec.water_m = inputs.water_distance_m;
      rec.slope = a.indicators.slope;
      rec.aspect = a.indicators.aspect;
      rec.form = a.indicators.form;
      rec.longitudinal = a.indicators.longitudinal;
      rec.dem_water = a.metrics.wetness;
      rec.tpi = a.metrics.tpi;
      rec.conv = a.metrics.convergence;
      rec.water = a.indicators.water;
      rec.score = a.total;
      rec.slope_deg = a.slope_deg;
      rec.aspect_deg = a.aspect_deg;
      layer.append(std::move(rec));
    }
    spdlog::info("[Analyzer] Scored {} sites ({} / {})", layer.size(),
                 ctx.culture_key, ctx.period_key);
    return layer;
  });
}

Outcome<LandmarkLayer> Analyzer::extractTerms(
    const RunOptions& options, const CancellationToken& token) const {
  constexpr const char* kOp = "extractTerms";
  if (auto why = checkSource(); !why.empty()) {
    return invalid<LandmarkLayer>(kOp, why);
  }
  if (options.max_candidates < 1) {
    return invalid<LandmarkLayer>(kOp, "max_candidates must be at least 1");
  }

  return guarded<LandmarkLayer>(kOp, [&] {
    const CulturalContext ctx = context(options);
    const CandidateSearch search(*dem_, cfg_);
    const auto result = search.run(ctx, options.max_candidates, token);
    if (result.selected.empty()) {
      spdlog::warn("[Analyzer] No core-point candidate passed the threshold");
    }
    const LandmarkDeriver deriver(*dem_, cfg_);
    return deriver.derive(result.selected, ctx);
  });
}

Outcome<LinkLayer> Analyzer::buildTermLinks(
    const LandmarkLayer& landmarks) const {
  return guarded<LinkLayer>("buildTermLinks", [&] {
    return StructuralLinker(cfg_.links, cfg_.terms).link(landmarks);
  });
}

Outcome<DrainageLayer> Analyzer::buildDrainageNetwork(
    const CancellationToken& token) const {
  constexpr const char* kOp = "buildDrainageNetwork";
  if (auto why = checkSource(); !why.empty()) {
    return invalid<DrainageLayer>(kOp, why);
  }
  return guarded<DrainageLayer>(kOp, [&] {
    return DrainageNetworkBuilder(*dem_, cfg_).build(token);
  });
}

Outcome<RidgeLayer> Analyzer::buildRidgeNetwork(
    const CancellationToken& token) const {
  constexpr const char* kOp = "buildRidgeNetwork";
  if (auto why = checkSource(); !why.empty()) {
    return invalid<RidgeLayer>(kOp, why);
  }
  return guarded<RidgeLayer>(kOp, [&] {
    return RidgeNetworkBuilder(*dem_, cfg_).build(token);
  });
}

}  // namespace geomancy
