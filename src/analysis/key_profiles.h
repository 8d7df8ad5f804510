#pragma once

/// @file key_profiles.h
/// @brief Reference key profiles for template matching against a chromagram.

#include <array>

#include "util/types.h"

namespace keybeat {

/// @brief Krumhansl-Schmuckler major key profile.
/// @details Index 0 = tonic, 1 = minor second, ..., 11 = major seventh.
/// Peaks at the tonic, fifth (7) and major third (4).
constexpr std::array<float, 12> KS_MAJOR_PROFILE = {6.35f, 2.23f, 3.48f, 2.33f, 4.38f, 4.09f,
                                                    2.52f, 5.19f, 2.39f, 3.66f, 2.29f, 2.88f};

/// @brief Krumhansl-Schmuckler minor key profile.
/// @details Peaks at the tonic, minor third (3) and fifth (7).
constexpr std::array<float, 12> KS_MINOR_PROFILE = {6.33f, 2.68f, 3.52f, 5.38f, 2.60f, 3.53f,
                                                    2.54f, 4.75f, 3.98f, 2.69f, 3.34f, 3.17f};

/// @brief Alternative Temperley major key profile.
constexpr std::array<float, 12> TEMPERLEY_MAJOR_PROFILE = {5.0f, 2.0f, 3.5f, 2.0f, 4.5f, 4.0f,
                                                           2.0f, 4.5f, 2.0f, 3.5f, 1.5f, 4.0f};

/// @brief Alternative Temperley minor key profile.
constexpr std::array<float, 12> TEMPERLEY_MINOR_PROFILE = {5.0f, 2.0f, 3.5f, 4.5f, 2.0f, 4.0f,
                                                           2.0f, 4.5f, 3.5f, 2.0f, 1.5f, 4.0f};

/// @brief Key profile type selection.
enum class KeyProfileType {
  KrumhanslSchmuckler,  ///< Krumhansl-Schmuckler (default)
  Temperley             ///< Temperley
};

/// @brief Similarity measure between chromagram and profile.
enum class ProfileMatch {
  Pearson,  ///< Pearson correlation (default)
  Cosine    ///< Cosine similarity
};

/// @brief Rotates a profile so that index `semitones` holds the tonic weight.
std::array<float, 12> rotate_profile(const std::array<float, 12>& profile, int semitones);

/// @brief Gets the major key profile for a given root.
/// @param root Root pitch class (C=0, C#=1, ..., B=11)
/// @param profile_type Profile type to use
/// @return Rotated profile starting at root
std::array<float, 12> get_major_profile(
    PitchClass root, KeyProfileType profile_type = KeyProfileType::KrumhanslSchmuckler);

/// @brief Gets the minor key profile for a given root.
/// @param root Root pitch class
/// @param profile_type Profile type to use
/// @return Rotated profile starting at root
std::array<float, 12> get_minor_profile(
    PitchClass root, KeyProfileType profile_type = KeyProfileType::KrumhanslSchmuckler);

/// @brief Gets the profile of a key.
std::array<float, 12> get_profile(PitchClass root, Mode mode,
                                  KeyProfileType profile_type = KeyProfileType::KrumhanslSchmuckler);

/// @brief Computes the similarity between a chroma vector and a key profile.
/// @param chroma Chroma vector [12]
/// @param profile Key profile [12]
/// @param match Similarity measure
/// @return Score in [-1, 1]; 0 for a constant (e.g. all-zero) chroma
float profile_correlation(const std::array<float, 12>& chroma,
                          const std::array<float, 12>& profile,
                          ProfileMatch match = ProfileMatch::Pearson);

}  // namespace keybeat
