/// @file BasicTests.cpp
/// @brief Basic smoke tests for Propel.Properties.

#include <catch2/catch_test_macros.hpp>
#include <Propel/Properties/Properties.hpp>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[properties][Basics]") {
  CHECK(Propel::Properties::LibraryName() == std::string_view{"Propel.Properties"});
}

TEST_CASE("ErrorCodesHaveReadableNames", "[properties][Basics]") {
  using namespace Propel::Properties;
  CHECK(ToString(ErrorCode::DuplicateMember) == std::string_view{"DuplicateMember"});
  CHECK(ToString(ErrorCode::ReadOnlyViolation) == std::string_view{"ReadOnlyViolation"});
  CHECK(ToString(DescriptorKind::Map) == std::string_view{"Map"});
}

TEST_CASE("MutabilitySetFormatsLikeAList", "[properties][Basics]") {
  using namespace Propel::Properties;
  MutabilitySet both{};
  both.Insert(Mutability::Read).Insert(Mutability::Write);
  MutabilitySet readOnly{};
  readOnly.Insert(Mutability::Read);
  CHECK(both.ToString() == "[Read, Write]");
  CHECK(readOnly.ToString() == "[Read]");
  CHECK(MutabilitySet{}.ToString() == "[]");
  CHECK_FALSE(both == readOnly);
}

TEST_CASE("LibraryLoggerIsRegisteredAndAdjustable", "[properties][Basics]") {
  using namespace Propel::Properties;
  SetLogLevel(spdlog::level::debug);
  auto logger = spdlog::get("propel.properties");
  REQUIRE(logger != nullptr);
  CHECK(logger->level() == spdlog::level::debug);
  SetLogLevel(spdlog::level::warn);
  CHECK(logger->level() == spdlog::level::warn);
}
