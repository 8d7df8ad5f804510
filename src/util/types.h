#pragma once

/// @file types.h
/// @brief Shared vocabulary types: pitch classes, modes, error codes.

namespace keybeat {

/// @brief Pitch class (0-11, C=0). Sharps only; Ds is also E flat.
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Musical mode of a key.
enum class Mode {
  Major,
  Minor,
};

/// @brief Maps a semitone offset from C onto its pitch class (negative offsets wrap).
inline PitchClass pitch_class(int semitones) {
  return static_cast<PitchClass>((semitones % 12 + 12) % 12);
}

/// @brief Returns the sharp spelling of a pitch class ("C", "C#", ... "B").
inline const char* pitch_class_name(PitchClass pc) {
  static const char* const kNames[12] = {"C",  "C#", "D",  "D#", "E",  "F",
                                         "F#", "G",  "G#", "A",  "A#", "B"};
  return kNames[static_cast<int>(pc)];
}

/// @brief Returns "major" or "minor".
inline const char* mode_name(Mode m) { return m == Mode::Major ? "major" : "minor"; }

/// @brief Analysis window shapes.
enum class WindowType {
  Hann,
  Hamming,
};

/// @brief Error codes carried by KeybeatException.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,      ///< Input file cannot be opened
  InvalidFormat,     ///< Not a supported container
  DecodeFailed,      ///< Container recognized but samples could not be read or written
  InvalidParameter,  ///< Configuration or argument out of range
  Cancelled,         ///< Cancellation token fired
};

/// @brief Returns a human-readable message for an error code.
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::Cancelled:
      return "Cancelled";
  }
  return "Unknown error";
}

}  // namespace keybeat
