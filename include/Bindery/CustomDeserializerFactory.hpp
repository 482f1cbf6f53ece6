// CustomDeserializerFactory.hpp
// Resolution facade: exact-type overrides and mix-in overlays in front of the base factory chain
#pragma once

#include <Bindery/BasicDeserializerFactory.hpp>
#include <Bindery/Deserializer.hpp>
#include <Bindery/DirectMappingRegistry.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/MixInRegistry.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/TypeKey.hpp>
#include <Bindery/Types.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace Bindery
{

  /**
   * Factory with configurable overrides, backed by BasicDeserializerFactory.
   *
   * - Specific mappings bind one type, and only that type, to a deserializer. They
   *   are checked before anything else by all three creation entry points, and a
   *   hit is returned as-is.
   * - Mix-in mappings record that annotations of a source type supplement those of
   *   a destination type. They are only stored here; introspection reads them
   *   through MixInResolver.
   *
   * Configure fully before sharing. After that every entry point is const and the
   * instance may be used from any number of threads without locking.
   *
   * A subclass must provide its own WithAdditionalDeserializers, most easily by
   * deriving from FactorySpecialization<Subclass>.
   */
  class BINDERY_API CustomDeserializerFactory : public BasicDeserializerFactory, public MixInResolver
  {
  public:
    CustomDeserializerFactory() = default;

    // Copies the mappings and overlays of `other`, with `additional` as extension list.
    CustomDeserializerFactory(const CustomDeserializerFactory &other, DeserializersList additional);

    [[nodiscard]] ExpectedFactory WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const override;

    /**
     * Use `deserializer` for T and never for T's subtypes. The deserializer may
     * produce a narrower type than T. Replaces any earlier mapping for T.
     */
    template <class T, class D>
      requires detail::MappableTo<D, T>
    [[nodiscard]] std::expected<void, Error> AddSpecificMapping(std::shared_ptr<D> deserializer)
    {
      return AddSpecificMapping(TypeDescriptor::Of<T>(), std::move(deserializer));
    }

    // Untyped form for types described at runtime; assignability is the caller's concern.
    [[nodiscard]] std::expected<void, Error> AddSpecificMapping(const TypeDescriptor &type, DeserializerPtr deserializer);

    // Annotations of Source (and its supertypes) override those of Destination.
    template <class Destination, class Source>
    void AddMixInAnnotations()
    {
      AddMixInAnnotations(TypeDescriptor::Of<Destination>(), TypeDescriptor::Of<Source>());
    }

    void AddMixInAnnotations(const TypeDescriptor &destination, const TypeDescriptor &source);
    void AddMixInAnnotations(const TypeKey &destination, const TypeKey &source);

    [[nodiscard]] std::optional<TypeKey> FindMixInClassFor(const TypeKey &destination) const override;

    [[nodiscard]] ExpectedDeserializer CreateBeanDeserializer(const DeserializationConfig &config,
                                                              const TypeDescriptor &type,
                                                              const DeserializerProvider &provider) const override;
    [[nodiscard]] ExpectedDeserializer CreateArrayDeserializer(const DeserializationConfig &config,
                                                               const TypeDescriptor &type,
                                                               const DeserializerProvider &provider) const override;
    // Enums cannot be extended, so only a direct match can apply.
    [[nodiscard]] ExpectedDeserializer CreateEnumDeserializer(const DeserializationConfig &config,
                                                              const TypeDescriptor &type,
                                                              const DeserializerProvider &provider) const override;

    [[nodiscard]] const DirectMappingRegistry &DirectMappings() const noexcept { return m_directClassMappings; }
    [[nodiscard]] const MixInRegistry &MixInAnnotations() const noexcept { return m_mixInAnnotations; }

  private:
    [[nodiscard]] DeserializerPtr FindDirectMapping(const TypeDescriptor &type) const;

    DirectMappingRegistry m_directClassMappings;
    MixInRegistry m_mixInAnnotations;
  };

  /**
   * Supplies the extension path of a factory subclass at compile time:
   *
   *   class AuditedFactory : public FactorySpecialization<AuditedFactory>
   *   {
   *   public:
   *     AuditedFactory(const AuditedFactory &other, DeserializersList additional)
   *         : FactorySpecialization(other, std::move(additional)), m_tag(other.m_tag) {}
   *   };
   *
   * Derived must be publicly constructible from (const Derived&, DeserializersList).
   * A further subclass of Derived is again rejected at runtime unless it does the same,
   * e.g. by deriving from FactorySpecialization<Further, Derived>; the constructors of
   * Base are inherited.
   */
  template <class Derived, class Base = CustomDeserializerFactory>
  class FactorySpecialization : public Base
  {
    static_assert(std::is_base_of_v<CustomDeserializerFactory, Base>,
                  "FactorySpecialization extends CustomDeserializerFactory or one of its subclasses");

  public:
    using Base::Base;

    FactorySpecialization() = default;
    FactorySpecialization(const FactorySpecialization &other, DeserializersList additional)
        : Base(other, std::move(additional))
    {
    }

    [[nodiscard]] ExpectedFactory WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const override
    {
      static_assert(std::is_constructible_v<Derived, const Derived &, DeserializersList>,
                    "factory subclass must be constructible from (const Derived&, DeserializersList)");
      auto list = this->ExtendedDeserializers(additional, typeid(Derived));
      if (!list.has_value())
        return std::unexpected(list.error());
      return std::make_shared<Derived>(static_cast<const Derived &>(*this), std::move(list.value()));
    }
  };

} // namespace Bindery
