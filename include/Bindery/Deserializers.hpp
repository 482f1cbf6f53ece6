// Deserializers.hpp
// Extension point for the base factory chain, and a ready-made provider keyed by type
#pragma once

#include <Bindery/Config.hpp>
#include <Bindery/Deserializer.hpp>
#include <Bindery/DirectMappingRegistry.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/Types.hpp>

#include <NGIN/Primitives.hpp>

#include <expected>
#include <memory>
#include <utility>

namespace Bindery
{

  /**
   * Pluggable provider consulted by BasicDeserializerFactory before its own
   * fallback. Each hook returns an empty pointer when the provider does not
   * handle the type; the first non-empty answer wins.
   */
  class BINDERY_API Deserializers
  {
  public:
    virtual ~Deserializers() = default;

    [[nodiscard]] virtual DeserializerPtr FindBeanDeserializer(const TypeDescriptor &type,
                                                               const DeserializationConfig &config,
                                                               const DeserializerProvider &provider) const;
    [[nodiscard]] virtual DeserializerPtr FindArrayDeserializer(const TypeDescriptor &type,
                                                                const DeserializationConfig &config,
                                                                const DeserializerProvider &provider) const;
    [[nodiscard]] virtual DeserializerPtr FindEnumDeserializer(const TypeDescriptor &type,
                                                               const DeserializationConfig &config,
                                                               const DeserializerProvider &provider) const;
  };

  // Exact-type provider; answers for every category.
  class BINDERY_API SimpleDeserializers : public Deserializers
  {
  public:
    template <class T, class D>
      requires detail::MappableTo<D, T>
    [[nodiscard]] std::expected<void, Error> AddDeserializer(std::shared_ptr<D> deserializer)
    {
      return AddDeserializer(TypeKey::Of<T>(), std::move(deserializer));
    }

    [[nodiscard]] std::expected<void, Error> AddDeserializer(const TypeKey &key, DeserializerPtr deserializer);

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_mappings.Size(); }

    [[nodiscard]] DeserializerPtr FindBeanDeserializer(const TypeDescriptor &type,
                                                       const DeserializationConfig &config,
                                                       const DeserializerProvider &provider) const override;
    [[nodiscard]] DeserializerPtr FindArrayDeserializer(const TypeDescriptor &type,
                                                        const DeserializationConfig &config,
                                                        const DeserializerProvider &provider) const override;
    [[nodiscard]] DeserializerPtr FindEnumDeserializer(const TypeDescriptor &type,
                                                       const DeserializationConfig &config,
                                                       const DeserializerProvider &provider) const override;

  private:
    DirectMappingRegistry m_mappings;
  };

} // namespace Bindery
