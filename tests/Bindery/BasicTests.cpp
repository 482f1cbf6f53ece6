/// @file BasicTests.cpp
/// @brief Basic smoke tests for the Bindery library.

#include <catch2/catch_test_macros.hpp>
#include <Bindery/Bindery.hpp>

#include <expected>
#include <string_view>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[bindery][Basics]") {
  CHECK(Bindery::LibraryName() == std::string_view{"Bindery"});
}

TEST_CASE("DeserializationConfigTogglesFeatures", "[bindery][Basics]") {
  using namespace Bindery;

  DeserializationConfig config{};
  CHECK(config.IsEnabled(DeserializationFeature::FailOnUnknownProperties));
  CHECK_FALSE(config.IsEnabled(DeserializationFeature::ReadEnumsUsingIndex));

  config.Enable(DeserializationFeature::ReadEnumsUsingIndex).Disable(DeserializationFeature::FailOnUnknownProperties);
  CHECK(config.IsEnabled(DeserializationFeature::ReadEnumsUsingIndex));
  CHECK_FALSE(config.IsEnabled(DeserializationFeature::FailOnUnknownProperties));

  config.Set(DeserializationFeature::AcceptSingleValueAsArray, true);
  CHECK(config.Features() == (static_cast<NGIN::UInt32>(DeserializationFeature::ReadEnumsUsingIndex) |
                              static_cast<NGIN::UInt32>(DeserializationFeature::AcceptSingleValueAsArray)));
}

TEST_CASE("NullForPrimitivesFollowsFeatureFlag", "[bindery][Basics]") {
  using namespace Bindery;

  class Counter : public TypedDeserializer<int> {
  public:
    std::expected<int, Error> DeserializeValue(std::string_view, const DeserializationConfig &) const override {
      return 7;
    }
  };

  Counter counter;
  DeserializationConfig config{};
  auto lenient = counter.Deserialize("null", config);
  REQUIRE(lenient.has_value());
  CHECK(lenient->Cast<int>() == 0);

  auto regular = counter.Deserialize("12", config);
  REQUIRE(regular.has_value());
  CHECK(regular->Cast<int>() == 7);

  config.Enable(DeserializationFeature::FailOnNullForPrimitives);
  auto strict = counter.Deserialize("null", config);
  REQUIRE_FALSE(strict.has_value());
  CHECK(strict.error().code == ErrorCode::Malformed);
}
