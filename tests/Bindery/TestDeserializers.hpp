// TestDeserializers.hpp — shared types and deserializers for the Bindery tests
#pragma once

#include <Bindery/Bindery.hpp>

#include <atomic>
#include <charconv>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace BinderyTest
{
  struct Money
  {
    long long cents{};
    std::string currency{};
  };

  struct Price
  {
    Money amount{};
  };

  struct PublicApiView
  {
  };

  struct InternalAnnotations
  {
  };

  struct Shape
  {
    virtual ~Shape() = default;
  };

  struct Circle : Shape
  {
    double radius{};
  };

  enum class Color
  {
    Red,
    Green,
    Blue
  };

  template <class T>
  struct Box
  {
    T value{};
  };

  // Always produces the same value.
  template <class T>
  class FixedDeserializer : public Bindery::TypedDeserializer<T>
  {
  public:
    explicit FixedDeserializer(T value = T{}) : m_value(std::move(value)) {}

    std::expected<T, Bindery::Error> DeserializeValue(std::string_view,
                                                      const Bindery::DeserializationConfig &) const override
    {
      return m_value;
    }

  private:
    T m_value;
  };

  // "<cents> <currency>", e.g. "1250 EUR".
  class MoneyDeserializer : public Bindery::TypedDeserializer<Money>
  {
  public:
    std::expected<Money, Bindery::Error> DeserializeValue(std::string_view text,
                                                          const Bindery::DeserializationConfig &) const override
    {
      Money m{};
      const auto *first = text.data();
      const auto *last = text.data() + text.size();
      auto [ptr, ec] = std::from_chars(first, last, m.cents);
      if (ec != std::errc{} || ptr == last || *ptr != ' ')
        return std::unexpected(Bindery::Error{Bindery::ErrorCode::Malformed, "expected '<cents> <currency>'"});
      m.currency.assign(ptr + 1, last);
      if (m.currency.empty())
        return std::unexpected(Bindery::Error{Bindery::ErrorCode::Malformed, "missing currency"});
      return m;
    }
  };

  // Extension that answers every category with one deserializer and counts how often it was asked.
  class CatchAllDeserializers : public Bindery::Deserializers
  {
  public:
    explicit CatchAllDeserializers(Bindery::DeserializerPtr deser) : m_deser(std::move(deser)) {}

    Bindery::DeserializerPtr FindBeanDeserializer(const Bindery::TypeDescriptor &, const Bindery::DeserializationConfig &,
                                                  const Bindery::DeserializerProvider &) const override
    {
      ++m_calls;
      return m_deser;
    }
    Bindery::DeserializerPtr FindArrayDeserializer(const Bindery::TypeDescriptor &, const Bindery::DeserializationConfig &,
                                                   const Bindery::DeserializerProvider &) const override
    {
      ++m_calls;
      return m_deser;
    }
    Bindery::DeserializerPtr FindEnumDeserializer(const Bindery::TypeDescriptor &, const Bindery::DeserializationConfig &,
                                                  const Bindery::DeserializerProvider &) const override
    {
      ++m_calls;
      return m_deser;
    }

    [[nodiscard]] int Calls() const noexcept { return m_calls.load(); }

  private:
    Bindery::DeserializerPtr m_deser;
    mutable std::atomic<int> m_calls{0};
  };

  inline Bindery::DeserializerProvider ProviderFor(std::shared_ptr<const Bindery::DeserializerFactory> factory)
  {
    return Bindery::DeserializerProvider{std::move(factory)};
  }
} // namespace BinderyTest
