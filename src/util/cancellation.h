#pragma once

/// @file cancellation.h
/// @brief Cooperative cancellation flag for long-running analysis.

#include <atomic>

#include "util/exception.h"

namespace keybeat {

/// @brief Cancellation flag shared between a caller and running analysis tasks.
/// @details Detectors poll it between frames. Cancelling never touches shared caches,
/// so abandoned tasks leave the FFT plan cache intact.
class CancellationToken {
 public:
  CancellationToken() : cancelled_(false), parent_(nullptr) {}

  /// @brief Creates a token that also reports cancellation of `parent` (may be null).
  explicit CancellationToken(const CancellationToken* parent)
      : cancelled_(false), parent_(parent) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /// @brief Requests cancellation.
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

  /// @brief Returns true once cancel() has been called.
  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_relaxed) ||
           (parent_ != nullptr && parent_->is_cancelled());
  }

  /// @brief Throws KeybeatException(Cancelled) if cancellation was requested.
  void throw_if_cancelled() const {
    if (is_cancelled()) {
      throw KeybeatException(ErrorCode::Cancelled);
    }
  }

 private:
  std::atomic<bool> cancelled_;
  const CancellationToken* parent_;
};

/// @brief Polls an optional token.
inline void check_cancelled(const CancellationToken* token) {
  if (token != nullptr) {
    token->throw_if_cancelled();
  }
}

}  // namespace keybeat
