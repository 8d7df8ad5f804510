/// @file exception_test.cpp
/// @brief Tests for KeybeatException and the check macros.

#include "util/exception.h"

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "util/cancellation.h"

using namespace keybeat;

TEST_CASE("error_message covers every code", "[exception]") {
  REQUIRE(std::string(error_message(ErrorCode::Ok)) == "OK");
  REQUIRE(std::string(error_message(ErrorCode::FileNotFound)) == "File not found");
  REQUIRE(std::string(error_message(ErrorCode::InvalidFormat)) == "Invalid format");
  REQUIRE(std::string(error_message(ErrorCode::DecodeFailed)) == "Decode failed");
  REQUIRE(std::string(error_message(ErrorCode::InvalidParameter)) == "Invalid parameter");
  REQUIRE(std::string(error_message(ErrorCode::Cancelled)) == "Cancelled");
}

TEST_CASE("KeybeatException describe", "[exception]") {
  KeybeatException detailed(ErrorCode::FileNotFound, "Cannot open file: a.wav");
  REQUIRE(std::string(detailed.what()) == "Cannot open file: a.wav");
  REQUIRE(detailed.describe() == "Cannot open file: a.wav (File not found)");

  KeybeatException plain(ErrorCode::InvalidParameter);
  REQUIRE(std::string(plain.what()) == "Invalid parameter");
  REQUIRE(plain.describe() == "Invalid parameter");
}

TEST_CASE("KeybeatException cancelled", "[exception]") {
  REQUIRE_FALSE(KeybeatException(ErrorCode::DecodeFailed).cancelled());
  REQUIRE_FALSE(KeybeatException(ErrorCode::InvalidParameter, "Hop must be positive").cancelled());

  CancellationToken token;
  token.cancel();
  try {
    token.throw_if_cancelled();
    FAIL("expected Cancelled");
  } catch (const KeybeatException& e) {
    REQUIRE(e.cancelled());
    REQUIRE(e.describe() == "Cancelled");
  }
}

TEST_CASE("check macros", "[exception]") {
  REQUIRE_NOTHROW(KEYBEAT_CHECK(1 + 1 == 2, ErrorCode::InvalidParameter));

  try {
    KEYBEAT_CHECK_MSG(false, ErrorCode::InvalidFormat, "Not a RIFF file");
    FAIL("expected InvalidFormat");
  } catch (const KeybeatException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidFormat);
    REQUIRE(e.describe() == "Not a RIFF file (Invalid format)");
  }
}
