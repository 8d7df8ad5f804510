/// @file camelot_test.cpp
/// @brief Tests for Camelot wheel notation.

#include "analysis/camelot.h"

#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>

using namespace keybeat;

TEST_CASE("camelot_code known keys", "[camelot]") {
  REQUIRE(camelot_string(PitchClass::C, Mode::Major) == "8B");
  REQUIRE(camelot_string(PitchClass::A, Mode::Minor) == "8A");
  REQUIRE(camelot_string(PitchClass::G, Mode::Major) == "9B");
  REQUIRE(camelot_string(PitchClass::E, Mode::Minor) == "9A");
  REQUIRE(camelot_string(PitchClass::B, Mode::Major) == "1B");
  REQUIRE(camelot_string(PitchClass::Gs, Mode::Minor) == "1A");
  REQUIRE(camelot_string(PitchClass::E, Mode::Major) == "12B");
  REQUIRE(camelot_string(PitchClass::Cs, Mode::Minor) == "12A");
  REQUIRE(camelot_string(PitchClass::F, Mode::Major) == "7B");
  REQUIRE(camelot_string(PitchClass::D, Mode::Minor) == "7A");
}

TEST_CASE("camelot_code covers the wheel", "[camelot]") {
  std::set<std::string> codes;
  for (int pc = 0; pc < 12; ++pc) {
    for (Mode mode : {Mode::Major, Mode::Minor}) {
      CamelotCode code = camelot_code(static_cast<PitchClass>(pc), mode);
      REQUIRE(code.number >= 1);
      REQUIRE(code.number <= 12);
      REQUIRE(code.letter == (mode == Mode::Major ? 'B' : 'A'));
      codes.insert(code.to_string());
    }
  }
  REQUIRE(codes.size() == 24);
}

TEST_CASE("camelot relative keys share a number", "[camelot]") {
  for (int pc = 0; pc < 12; ++pc) {
    // Relative minor is three semitones below the major tonic
    int relative_minor = (pc + 9) % 12;
    CamelotCode major = camelot_code(static_cast<PitchClass>(pc), Mode::Major);
    CamelotCode minor = camelot_code(static_cast<PitchClass>(relative_minor), Mode::Minor);
    REQUIRE(major.number == minor.number);
  }
}

TEST_CASE("camelot neighbours are a fifth apart", "[camelot]") {
  for (int pc = 0; pc < 12; ++pc) {
    int fifth = (pc + 7) % 12;
    int n = camelot_code(static_cast<PitchClass>(pc), Mode::Major).number;
    int next = camelot_code(static_cast<PitchClass>(fifth), Mode::Major).number;
    REQUIRE(next == n % 12 + 1);
  }
}
