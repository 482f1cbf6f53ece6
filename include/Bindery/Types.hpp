// Types.hpp
// Public-facing error codes, result aliases and the boxed value type
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace Bindery
{

  using Any = NGIN::Utilities::Any<>;
  using ModuleId = NGIN::UInt64;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    Malformed = 4,
  };

  [[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::InvalidState:
      return "InvalidState";
    case ErrorCode::Malformed:
      return "Malformed";
    }
    return "Unknown";
  }

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
  };

  // Creation categories served by the factory entry points.
  enum class TypeCategory : NGIN::UInt8
  {
    Record = 0,
    Array = 1,
    Enumerated = 2,
  };

  [[nodiscard]] constexpr std::string_view ToString(TypeCategory category) noexcept
  {
    switch (category)
    {
    case TypeCategory::Record:
      return "record";
    case TypeCategory::Array:
      return "array";
    case TypeCategory::Enumerated:
      return "enum";
    }
    return "unknown";
  }

  class Deserializer;
  class Deserializers;
  class DeserializerFactory;
  class DeserializerProvider;

  using DeserializerPtr = std::shared_ptr<Deserializer>;
  using ExpectedDeserializer = std::expected<DeserializerPtr, Error>;
  using ExpectedFactory = std::expected<std::shared_ptr<DeserializerFactory>, Error>;

} // namespace Bindery
