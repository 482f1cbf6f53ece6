// Config.hpp
// Runtime deserialization settings handed through the factories to every deserializer
#pragma once

#include <Bindery/Export.hpp>

#include <NGIN/Primitives.hpp>

namespace Bindery
{

  enum class DeserializationFeature : NGIN::UInt32
  {
    FailOnUnknownProperties = 1u << 0,
    FailOnNullForPrimitives = 1u << 1,
    ReadEnumsUsingIndex = 1u << 2,
    AcceptSingleValueAsArray = 1u << 3,
  };

  // The factories pass this through untouched; deserializers read it.
  class BINDERY_API DeserializationConfig
  {
  public:
    static constexpr NGIN::UInt32 DefaultFeatures = static_cast<NGIN::UInt32>(DeserializationFeature::FailOnUnknownProperties);

    constexpr DeserializationConfig() = default;
    constexpr explicit DeserializationConfig(NGIN::UInt32 features) noexcept : m_features(features) {}

    [[nodiscard]] constexpr bool IsEnabled(DeserializationFeature f) const noexcept
    {
      return (m_features & static_cast<NGIN::UInt32>(f)) != 0;
    }

    constexpr DeserializationConfig &Enable(DeserializationFeature f) noexcept
    {
      m_features |= static_cast<NGIN::UInt32>(f);
      return *this;
    }

    constexpr DeserializationConfig &Disable(DeserializationFeature f) noexcept
    {
      m_features &= ~static_cast<NGIN::UInt32>(f);
      return *this;
    }

    constexpr DeserializationConfig &Set(DeserializationFeature f, bool enabled) noexcept
    {
      return enabled ? Enable(f) : Disable(f);
    }

    [[nodiscard]] constexpr NGIN::UInt32 Features() const noexcept { return m_features; }

  private:
    NGIN::UInt32 m_features{DefaultFeatures};
  };

} // namespace Bindery
