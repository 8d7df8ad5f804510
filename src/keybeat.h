#pragma once

/// @file keybeat.h
/// @brief Main header for keybeat - tempo and key detection library.
/// @details Include this file to access all keybeat functionality except WAV I/O, which
///          lives in the keybeat_io target (core/audio_io.h).

// Version information
#define KEYBEAT_VERSION_MAJOR 1
#define KEYBEAT_VERSION_MINOR 0
#define KEYBEAT_VERSION_PATCH 0
#define KEYBEAT_VERSION_STRING "1.0.0"

// Utility
#include "util/cancellation.h"
#include "util/constants.h"
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/fft.h"
#include "core/frames.h"
#include "core/sample_buffer.h"
#include "core/waveform.h"
#include "core/window.h"

// Filters
#include "filters/chroma.h"
#include "filters/mel.h"

// Features
#include "feature/chroma.h"
#include "feature/onset.h"

// Analysis
#include "analysis/camelot.h"
#include "analysis/key_detector.h"
#include "analysis/key_profiles.h"
#include "analysis/music_analyzer.h"
#include "analysis/tempo_detector.h"

// Pipeline
#include "pipeline/analysis_session.h"
#include "pipeline/export_format.h"
#include "pipeline/media_probe.h"

namespace keybeat {

/// @brief Returns the library version string.
inline const char* version() { return KEYBEAT_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return KEYBEAT_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return KEYBEAT_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return KEYBEAT_VERSION_PATCH; }

}  // namespace keybeat
