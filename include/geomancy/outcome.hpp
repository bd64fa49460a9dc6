// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_OUTCOME_HPP
#define GEOMANCY_OUTCOME_HPP

#include <string>
#include <utility>

namespace geomancy {

enum class Status {
  Ok,
  Cancelled,     ///< Caller signalled the cancellation token
  InvalidInput,  ///< Precondition failed before any computation
  Failed         ///< Unexpected internal error
};

inline const char* toString(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::Cancelled:
      return "cancelled";
    case Status::InvalidInput:
      return "invalid input";
    case Status::Failed:
      return "failed";
  }
  return "failed";
}

/// Result of a public analysis operation. `value` is meaningful only when
/// ok(); no partial result is carried on any other status.
template <typename T>
struct Outcome {
  Status status = Status::Ok;
  T value{};
  std::string message;

  bool ok() const noexcept { return status == Status::Ok; }

  static Outcome success(T value) {
    Outcome out;
    out.value = std::move(value);
    return out;
  }

  static Outcome failure(Status status, std::string message) {
    Outcome out;
    out.status = status;
    out.message = std::move(message);
    return out;
  }
};

}  // namespace geomancy

#endif  // GEOMANCY_OUTCOME_HPP
