// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef GEOMANCY_CANCELLATION_HPP
#define GEOMANCY_CANCELLATION_HPP

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace geomancy {

/// Raised inside a scan when its token has been signalled.
class OperationCancelled : public std::runtime_error {
 public:
  explicit OperationCancelled(const std::string& where)
      : std::runtime_error("cancelled during " + where) {}
};

/**
 * @brief Cooperative cancellation flag shared between a caller and a scan.
 *
 * Copies share the same flag, so a caller keeps one copy and hands another
 * to the analysis call. Long loops poll it once per lattice column.
 */
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }

  bool isCancelled() const noexcept {
    return flag_->load(std::memory_order_relaxed);
  }

  /// @throws OperationCancelled if cancel() has been called.
  void throwIfCancelled(const char* where) const {
    if (isCancelled()) throw OperationCancelled(where);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace geomancy

#endif  // GEOMANCY_CANCELLATION_HPP
