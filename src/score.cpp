// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "geomancy/score.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace geomancy {

double gaussianScore(double value, double target, double sigma) {
  const double s = std::max(sigma, kMinSigma);
  const double z = (value - target) / s;
  return std::exp(-(z * z));
}

Score gaussianScore(const Score& value, const GaussianTarget& spec) {
  if (!value) return std::nullopt;
  return gaussianScore(*value, spec.target, spec.sigma);
}

Score meanOfPresent(std::initializer_list<Score> values) {
  double sum = 0.0;
  int count = 0;
  for (const auto& v : values) {
    if (v) {
      sum += *v;
      ++count;
    }
  }
  if (count == 0) return std::nullopt;
  return sum / count;
}

Score meanOfPresent(const std::vector<Score>& values) {
  double sum = 0.0;
  int count = 0;
  for (const auto& v : values) {
    if (v) {
      sum += *v;
      ++count;
    }
  }
  if (count == 0) return std::nullopt;
  return sum / count;
}

Score weightedMean(const std::vector<std::pair<double, Score>>& entries) {
  double numerator = 0.0;
  double denominator = 0.0;
  bool any = false;
  for (const auto& [weight, value] : entries) {
    if (!value) continue;
    numerator += weight * *value;
    denominator += weight;
    any = true;
  }
  if (!any || denominator <= 0.0) return std::nullopt;
  return numerator / denominator;
}

Score mean(const std::vector<double>& values) {
  if (values.empty()) return std::nullopt;
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

Score stddev(const std::vector<double>& values) {
  if (values.empty()) return std::nullopt;
  if (values.size() == 1) return 0.0;
  const double m = *mean(values);
  double variance = 0.0;
  for (double v : values) variance += (v - m) * (v - m);
  variance /= static_cast<double>(values.size());
  return std::sqrt(variance);
}

std::string formatScore(const Score& value, int digits) {
  if (!value) return "n/a";
  return fmt::format("{:.{}f}", *value, digits);
}

}  // namespace geomancy
