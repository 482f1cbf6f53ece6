// Deserializer.hpp
// Handler interface: turns a serialized representation into a value of its target type
#pragma once

#include <Bindery/Config.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/TypeKey.hpp>
#include <Bindery/Types.hpp>

#include <concepts>
#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Bindery
{

  class BINDERY_API Deserializer
  {
  public:
    virtual ~Deserializer() = default;

    // Key of the type this deserializer produces.
    [[nodiscard]] virtual TypeKey HandledType() const = 0;

    [[nodiscard]] virtual std::expected<Any, Error> Deserialize(std::string_view text,
                                                                const DeserializationConfig &config) const = 0;
  };

  /**
   * Convenience base for deserializers of a statically known type. Implement
   * `DeserializeValue`; the boxed `Deserialize` is derived from it.
   *
   * For arithmetic and enum types a literal "null" never reaches
   * `DeserializeValue`: it yields `T{}`, or ErrorCode::Malformed when
   * DeserializationFeature::FailOnNullForPrimitives is enabled.
   */
  template <class T>
  class TypedDeserializer : public Deserializer
  {
  public:
    using ValueType = T;

    [[nodiscard]] TypeKey HandledType() const override { return TypeKey::Of<T>(); }

    [[nodiscard]] std::expected<Any, Error> Deserialize(std::string_view text,
                                                        const DeserializationConfig &config) const override
    {
      if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>)
      {
        if (text == "null")
        {
          if (config.IsEnabled(DeserializationFeature::FailOnNullForPrimitives))
            return std::unexpected(Error{ErrorCode::Malformed, "null value for primitive type"});
          return Any{T{}};
        }
      }
      auto value = DeserializeValue(text, config);
      if (!value.has_value())
        return std::unexpected(value.error());
      return Any{std::move(value.value())};
    }

    [[nodiscard]] virtual std::expected<T, Error> DeserializeValue(std::string_view text,
                                                                   const DeserializationConfig &config) const = 0;
  };

  namespace detail
  {
    template <class D>
    concept HasValueType = requires { typename D::ValueType; };

    // U is T or a subtype of T, so the boxed value can be read back as T.
    template <class U, class T>
    concept AssignableTo = std::same_as<U, T> || std::derived_from<U, T>;

    // Deserializers of unknown static output are accepted as-is.
    template <class D, class T>
    concept MappableTo = std::derived_from<D, Deserializer> &&
                         (!HasValueType<D> || AssignableTo<typename D::ValueType, T>);
  } // namespace detail

} // namespace Bindery
