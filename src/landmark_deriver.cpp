// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/terms/landmark_deriver.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace geomancy {

namespace {

const char* describeMode(const std::string& mode) {
  if (mode == "max") return "local maximum";
  if (mode == "min") return "local minimum";
  if (mode == "gentle") return "gentle point";
  if (mode == "refine") return "frontal refinement";
  return "estimate";
}

std::string composeReason(const std::string& name, const LandmarkRecord& rec) {
  const char* label = rec.azimuth ? compassLabel(*rec.azimuth) : "ring";
  return fmt::format(
      "{} estimate. score={}, base={}, elev={}m, delta={} (target {}), "
      "fit={}, radius={}m, azimuth={}deg ({}), mode={}, basis={}.",
      name, formatScore(rec.score), formatScore(rec.base_score),
      formatScore(rec.elevation, 2), formatScore(rec.delta_rel, 4),
      formatScore(rec.target_rel, 4), formatScore(rec.fit_score),
      formatScore(rec.radius_m, 1), formatScore(rec.azimuth, 1), label,
      describeMode(rec.mode), rec.note);
}

}  // namespace

double TermRadii::of(RadiusClass radius_class) const {
  switch (radius_class) {
    case RadiusClass::Inner:
      return inner;
    case RadiusClass::Outer:
      return outer;
    case RadiusClass::Far:
      return far;
  }
  return inner;
}

LandmarkDeriver::LandmarkDeriver(const ElevationSource& source,
                                 const Config& cfg)
    : sampler_(source),
      sampling_(cfg.sampling),
      terms_(cfg.terms),
      step_(source.step()) {}

TermRadii LandmarkDeriver::radii(const CulturalContext& ctx) const {
  TermRadii r;
  r.inner = step_ * terms_.inner_radius_scale * ctx.micro_radius_multiplier;
  r.outer = step_ * terms_.outer_radius_scale * ctx.macro_radius_multiplier;
  r.far = step_ * terms_.far_radius_scale * ctx.macro_radius_multiplier;
  return r;
}

double LandmarkDeriver::scoreFloor(const CulturalContext& ctx) const {
  return std::max(terms_.min_score,
                  ctx.candidate_threshold * terms_.threshold_ratio);
}

double LandmarkDeriver::localRelief(const Point2& center,
                                    double outer_radius) const {
  const auto ring = sampler_.ring(center, outer_radius,
                                  ringBearings(terms_.relief_bearing_step));
  if (ring.empty()) return 1.0;
  const auto [lo, hi] = std::minmax_element(ring.begin(), ring.end());
  return std::max(1.0, *hi - *lo);
}

LandmarkLayer LandmarkDeriver::derive(const std::vector<Candidate>& candidates,
                                      const CulturalContext& ctx) const {
  LandmarkLayer layer("landmarks");
  const int total = std::max<int>(1, static_cast<int>(candidates.size()));
  int rank = 0;
  for (const auto& candidate : candidates) {
    deriveFor(candidate, ++rank, total, ctx, layer);
  }
  return layer;
}

void LandmarkDeriver::deriveFor(const Candidate& candidate, int rank,
                                int total, const CulturalContext& ctx,
                                LandmarkLayer& layer) const {
  const TermRadii r = radii(ctx);
  const Cardinals card = cardinalsFor(ctx.hemisphere);
  const Point2& center = candidate.point;
  const double center_elev = candidate.elevation;
  const double base = candidate.score;
  const double relief = localRelief(center, r.outer);
  const double floor = scoreFloor(ctx);
  const double shift = ctx.term_target_shift;

  auto emit = [&](LandmarkRecord rec, bool mandatory,
                  const std::string& reason) {
    if (rec.score) {
      rec.score = std::clamp(*rec.score + ctx.termBias(rec.term_id), 0.0, 1.0);
      if (!mandatory && *rec.score < floor) return;
    }
    rec.term_name = terms_.name(rec.term_id);
    rec.culture = ctx.culture_key;
    rec.period = ctx.period_key;
    rec.parent_id = rank;
    rec.rank = rank;
    rec.base_score = base;
    rec.relief_m = relief;
    rec.reason = reason.empty() ? composeReason(rec.term_name, rec) : reason;
    layer.append(std::move(rec));
  };

  // Scored relative to the centre with a Gaussian fit
  auto fitted = [&](const std::string& term_id, const Point2& point,
                    double elev, const GaussianTarget& target) {
    LandmarkRecord rec;
    rec.term_id = term_id;
    rec.point = point;
    rec.elevation = elev;
    rec.delta_rel = (elev - center_elev) / relief;
    rec.target_rel = target.target;
    rec.fit_score = gaussianScore(*rec.delta_rel, target);
    rec.score = meanOfPresent({base, rec.fit_score});
    return rec;
  };

  // Core point
  {
    const auto& m = candidate.metrics;
    LandmarkRecord rec;
    rec.term_id = term::core;
    rec.point = center;
    rec.elevation = center_elev;
    rec.score = base;
    rec.note = "core candidate";
    const std::string reason = fmt::format(
        "Core candidate #{}/{}. score={}, form={}, long={}, wetness={}, "
        "tpi={}, convergence={}, relief={}m, elev={}m, threshold>={:.3f} met.",
        rank, total, formatScore(base), formatScore(m.form_score),
        formatScore(m.long_score), formatScore(m.wetness),
        formatScore(m.tpi, 4), formatScore(m.convergence),
        formatScore(relief, 1), formatScore(center_elev, 2),
        ctx.candidate_threshold);
    emit(std::move(rec), true, reason);
  }

  // Basin
  {
    const double distance = r.inner * terms_.basin_offset;
    Point2 point = offsetPoint(center, distance, card.front);
    auto elev = sampler_.sample(point);
    if (!elev) {
      point = center;
      elev = center_elev;
    }
    GaussianTarget target = terms_.basin;
    target.target += shift * terms_.basin_shift_ratio;
    LandmarkRecord rec = fitted(term::basin, point, *elev, target);
    rec.radius_m = distance;
    rec.azimuth = card.front;
    rec.mode = "refine";
    rec.note = "open core basin";
    emit(std::move(rec), true, {});
  }

  for (const auto& spec : terms_.catalog) {
    const double azimuth = card.azimuth(spec.direction);
    const double radius = r.of(spec.radius);
    const auto hit =
        sampler_.sectorExtremum(center, radius, azimuth, spec.mode,
                                sampling_.sector_span, sampling_.sector_samples);
    if (!hit) continue;
    LandmarkRecord rec = fitted(spec.term_id, hit->point, hit->elevation,
                                {spec.target + shift, spec.sigma});
    rec.radius_m = radius;
    rec.azimuth = azimuth;
    rec.mode = toString(spec.mode);
    rec.note = fmt::format("delta={:.3f}", *rec.delta_rel);
    emit(std::move(rec), false, {});
  }

  // Inflow: lowest point on the outer ring
  if (const auto hit = sampler_.ringExtremum(center, r.outer, ExtremumMode::Min,
                                             sampling_.ring_extremum_step)) {
    GaussianTarget target = terms_.inflow;
    target.target += shift;
    LandmarkRecord rec =
        fitted(term::inflow, hit->point, hit->elevation, target);
    rec.radius_m = r.outer;
    rec.mode = "min";
    rec.note = fmt::format("ring_min delta={:.3f}", *rec.delta_rel);
    emit(std::move(rec), false, {});
  }

  // Apron: frontal point closest to the centre elevation
  if (const auto hit = sampler_.gentlePoint(center, r.inner, card.front,
                                            center_elev,
                                            sampling_.gentle_half_span,
                                            sampling_.gentle_step)) {
    GaussianTarget target = terms_.apron;
    target.target += shift * terms_.apron_shift_ratio;
    LandmarkRecord rec = fitted(term::apron, hit->point, hit->elevation, target);
    rec.radius_m = r.inner;
    rec.azimuth = card.front;
    rec.mode = "gentle";
    rec.note = fmt::format("gentle delta={:.3f}", *rec.delta_rel);
    emit(std::move(rec), false, {});
  }
}

}  // namespace geomancy
