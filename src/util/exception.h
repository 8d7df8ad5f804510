#pragma once

/// @file exception.h
/// @brief Error type thrown by keybeat and the check macros that raise it.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace keybeat {

/// @brief Error raised by decoding, configuration checks and cancelled analysis.
/// @details what() is the detail message when one was given, else error_message(code()).
class KeybeatException : public std::runtime_error {
 public:
  /// @param code Error code; the message is error_message(code)
  explicit KeybeatException(ErrorCode code) : std::runtime_error(error_message(code)), code_(code) {}

  /// @param code Error code
  /// @param message Detail such as "Cannot open file: song.wav"
  KeybeatException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

  /// @brief Returns true if a cancellation token stopped the work (not a failure).
  bool cancelled() const { return code_ == ErrorCode::Cancelled; }

  /// @brief Detail message followed by the code's message in parentheses.
  /// @details "Cannot open file: a.wav (File not found)". A code-only error is just
  ///          "File not found".
  std::string describe() const {
    std::string detail = what();
    std::string generic = error_message(code_);
    return detail == generic ? detail : detail + " (" + generic + ")";
  }

 private:
  ErrorCode code_;
};

/// @def KEYBEAT_CHECK
/// @brief Throws KeybeatException(code) if cond is false.
#define KEYBEAT_CHECK(cond, code)    \
  do {                               \
    if (!(cond)) {                   \
      throw KeybeatException(code);  \
    }                                \
  } while (0)

/// @def KEYBEAT_CHECK_MSG
/// @brief Throws KeybeatException(code, msg) if cond is false.
#define KEYBEAT_CHECK_MSG(cond, code, msg) \
  do {                                     \
    if (!(cond)) {                         \
      throw KeybeatException(code, msg);   \
    }                                      \
  } while (0)

}  // namespace keybeat
