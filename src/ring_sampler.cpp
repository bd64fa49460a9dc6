// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/analysis/ring_sampler.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace geomancy {

namespace {

bool better(ExtremumMode mode, double candidate, double best) {
  return mode == ExtremumMode::Max ? candidate > best : candidate < best;
}

}  // namespace

std::vector<double> ringBearings(int step_deg) {
  const int step = std::max(1, step_deg);
  std::vector<double> bearings;
  bearings.reserve(360 / step + 1);
  for (int a = 0; a < 360; a += step) bearings.push_back(a);
  return bearings;
}

std::vector<double> RingSampler::ring(const Point2& center, double radius,
                                      const std::vector<double>& azimuths) const {
  std::vector<double> values;
  values.reserve(azimuths.size());
  for (double azimuth : azimuths) {
    if (auto z = source_.sample(offsetPoint(center, radius, azimuth))) {
      values.push_back(*z);
    }
  }
  return values;
}

Score RingSampler::directionalMean(const Point2& center, double radius,
                                   double azimuth) const {
  static constexpr std::array<double, 5> kOffsets = {-30.0, -15.0, 0.0, 15.0,
                                                     30.0};
  std::vector<double> values;
  values.reserve(kOffsets.size());
  for (double offset : kOffsets) {
    const double a = wrapAzimuth(azimuth + offset);
    if (auto z = source_.sample(offsetPoint(center, radius, a))) {
      values.push_back(*z);
    }
  }
  return mean(values);
}

std::optional<RingHit> RingSampler::sectorExtremum(const Point2& center,
                                                   double radius, double azimuth,
                                                   ExtremumMode mode,
                                                   double span,
                                                   int samples) const {
  std::optional<RingHit> best;
  for (int i = 0; i < samples; ++i) {
    const double ratio =
        samples <= 1 ? 0.0 : static_cast<double>(i) / (samples - 1);
    const double a = wrapAzimuth(azimuth - span / 2.0 + ratio * span);
    const Point2 p = offsetPoint(center, radius, a);
    auto z = source_.sample(p);
    if (!z) continue;
    if (!best || better(mode, *z, best->elevation)) {
      best = RingHit{p, *z, a};
    }
  }
  return best;
}

std::optional<RingHit> RingSampler::ringExtremum(const Point2& center,
                                                 double radius,
                                                 ExtremumMode mode,
                                                 int step) const {
  std::optional<RingHit> best;
  for (double a : ringBearings(step)) {
    const Point2 p = offsetPoint(center, radius, a);
    auto z = source_.sample(p);
    if (!z) continue;
    if (!best || better(mode, *z, best->elevation)) {
      best = RingHit{p, *z, a};
    }
  }
  return best;
}

std::optional<RingHit> RingSampler::gentlePoint(const Point2& center,
                                                double radius, double azimuth,
                                                double reference,
                                                double half_span,
                                                int step) const {
  std::optional<RingHit> best;
  double best_delta = 0.0;
  const int first = static_cast<int>(azimuth - half_span);
  const int last = static_cast<int>(azimuth + half_span + 1.0);
  for (int a = first; a < last; a += std::max(1, step)) {
    const double wrapped = wrapAzimuth(a);
    const Point2 p = offsetPoint(center, radius, wrapped);
    auto z = source_.sample(p);
    if (!z) continue;
    const double delta = std::abs(*z - reference);
    if (!best || delta < best_delta) {
      best = RingHit{p, *z, wrapped};
      best_delta = delta;
    }
  }
  return best;
}

}  // namespace geomancy
