#include "analysis/key_profiles.h"

#include "util/math_utils.h"

namespace keybeat {

std::array<float, 12> rotate_profile(const std::array<float, 12>& profile, int semitones) {
  std::array<float, 12> rotated;
  for (int i = 0; i < 12; ++i) {
    rotated[i] = profile[static_cast<int>(pitch_class(i - semitones))];
  }
  return rotated;
}

std::array<float, 12> get_major_profile(PitchClass root, KeyProfileType profile_type) {
  const auto& base_profile =
      (profile_type == KeyProfileType::Temperley) ? TEMPERLEY_MAJOR_PROFILE : KS_MAJOR_PROFILE;
  return rotate_profile(base_profile, static_cast<int>(root));
}

std::array<float, 12> get_minor_profile(PitchClass root, KeyProfileType profile_type) {
  const auto& base_profile =
      (profile_type == KeyProfileType::Temperley) ? TEMPERLEY_MINOR_PROFILE : KS_MINOR_PROFILE;
  return rotate_profile(base_profile, static_cast<int>(root));
}

std::array<float, 12> get_profile(PitchClass root, Mode mode, KeyProfileType profile_type) {
  return mode == Mode::Major ? get_major_profile(root, profile_type)
                             : get_minor_profile(root, profile_type);
}

float profile_correlation(const std::array<float, 12>& chroma,
                          const std::array<float, 12>& profile, ProfileMatch match) {
  if (match == ProfileMatch::Cosine) {
    return cosine_similarity(chroma.data(), profile.data(), 12);
  }
  return pearson_correlation(chroma.data(), profile.data(), 12);
}

}  // namespace keybeat
