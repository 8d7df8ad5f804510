#include "analysis/camelot.h"

#include <array>

namespace keybeat {

namespace {

// Indexed by pitch class C..B
constexpr std::array<int, 12> kMajorNumbers = {8, 3, 10, 5, 12, 7, 2, 9, 4, 11, 6, 1};
constexpr std::array<int, 12> kMinorNumbers = {5, 12, 7, 2, 9, 4, 11, 6, 1, 8, 3, 10};

}  // namespace

std::string CamelotCode::to_string() const { return std::to_string(number) + letter; }

CamelotCode camelot_code(PitchClass root, Mode mode) {
  int pc = static_cast<int>(root);
  if (mode == Mode::Major) {
    return CamelotCode{kMajorNumbers[pc], 'B'};
  }
  return CamelotCode{kMinorNumbers[pc], 'A'};
}

std::string camelot_string(PitchClass root, Mode mode) {
  return camelot_code(root, mode).to_string();
}

}  // namespace keybeat
