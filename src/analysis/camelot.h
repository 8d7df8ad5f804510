#pragma once

/// @file camelot.h
/// @brief Camelot wheel notation for musical keys.

#include <string>

#include "util/types.h"

namespace keybeat {

/// @brief Position of a key on the Camelot wheel.
/// @details Minor keys use letter 'A', major keys 'B'. Relative major/minor pairs share a
///          number (C major 8B, A minor 8A); adjacent numbers are a fifth apart.
struct CamelotCode {
  int number;   ///< 1-12
  char letter;  ///< 'A' (minor) or 'B' (major)

  /// @brief Returns the code as text, e.g. "8B".
  std::string to_string() const;
};

/// @brief Looks up the Camelot code of a key.
/// @param root Tonic pitch class
/// @param mode Major or minor
/// @return Camelot code (static table, no computation)
CamelotCode camelot_code(PitchClass root, Mode mode);

/// @brief Looks up the Camelot code of a key as text.
std::string camelot_string(PitchClass root, Mode mode);

}  // namespace keybeat
