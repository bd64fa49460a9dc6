// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * score.hpp
 *
 * Optional-valued scores and the combination rules used by every
 * metric: absent inputs propagate, weighted combinations renormalise
 * over present entries.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef GEOMANCY_SCORE_HPP
#define GEOMANCY_SCORE_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geomancy {

/// A value that may be absent because its inputs were missing.
using Score = std::optional<double>;

/// Gaussian target: exp(-((v - target) / sigma)^2).
struct GaussianTarget {
  double target = 0.0;
  double sigma = 1.0;
};

/// Smallest sigma used by gaussianScore().
constexpr double kMinSigma = 1e-9;

/// exp(-((value - target) / sigma)^2) with sigma floored at kMinSigma.
/// Returns exactly 1.0 at value == target.
double gaussianScore(double value, double target, double sigma);

inline double gaussianScore(double value, const GaussianTarget& spec) {
  return gaussianScore(value, spec.target, spec.sigma);
}

/// Null-propagating overload.
Score gaussianScore(const Score& value, const GaussianTarget& spec);

/// Mean of the present values; absent if none is present.
Score meanOfPresent(std::initializer_list<Score> values);
Score meanOfPresent(const std::vector<Score>& values);

/// sum(w * v) / sum(w) over entries whose value is present.
/// Absent when nothing is present or the present weights sum to zero.
Score weightedMean(const std::vector<std::pair<double, Score>>& entries);

/// Arithmetic mean and population standard deviation.
Score mean(const std::vector<double>& values);
Score stddev(const std::vector<double>& values);

/// Fixed-precision text, "n/a" when absent.
std::string formatScore(const Score& value, int digits = 3);

}  // namespace geomancy

#endif  // GEOMANCY_SCORE_HPP
