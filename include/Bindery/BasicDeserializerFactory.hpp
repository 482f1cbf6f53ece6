// BasicDeserializerFactory.hpp
// Base factory chain: consults registered Deserializers extensions, then a per-category fallback
#pragma once

#include <Bindery/DeserializerFactory.hpp>
#include <Bindery/Deserializers.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/Types.hpp>

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Primitives.hpp>

#include <expected>
#include <memory>
#include <typeinfo>

namespace Bindery
{

  using DeserializersList = NGIN::Containers::Vector<std::shared_ptr<const Deserializers>>;

  namespace detail
  {
    // Copy of `list` with `item` in front, so the newest extension is consulted first.
    [[nodiscard]] BINDERY_API DeserializersList InsertInList(const DeserializersList &list,
                                                             std::shared_ptr<const Deserializers> item);
  } // namespace detail

  /**
   * Extension-driven factory. For every category the extension list is searched in
   * order; if no extension answers, the protected `Construct*` fallback runs. The
   * default fallbacks construct nothing and report ErrorCode::NotFound.
   *
   * Subclasses that add state must supply their own WithAdditionalDeserializers;
   * otherwise extension fails with ErrorCode::InvalidState instead of returning an
   * instance of the wrong type.
   */
  class BINDERY_API BasicDeserializerFactory : public DeserializerFactory
  {
  public:
    BasicDeserializerFactory() = default;
    explicit BasicDeserializerFactory(DeserializersList additional);

    [[nodiscard]] ExpectedFactory WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const override;

    [[nodiscard]] ExpectedDeserializer CreateBeanDeserializer(const DeserializationConfig &config,
                                                              const TypeDescriptor &type,
                                                              const DeserializerProvider &provider) const override;
    [[nodiscard]] ExpectedDeserializer CreateArrayDeserializer(const DeserializationConfig &config,
                                                               const TypeDescriptor &type,
                                                               const DeserializerProvider &provider) const override;
    [[nodiscard]] ExpectedDeserializer CreateEnumDeserializer(const DeserializationConfig &config,
                                                              const TypeDescriptor &type,
                                                              const DeserializerProvider &provider) const override;

    [[nodiscard]] const DeserializersList &AdditionalDeserializers() const noexcept { return m_additional; }
    [[nodiscard]] NGIN::UIntSize ExtensionCount() const noexcept { return m_additional.Size(); }

  protected:
    [[nodiscard]] virtual ExpectedDeserializer ConstructBeanDeserializer(const DeserializationConfig &config,
                                                                         const TypeDescriptor &type,
                                                                         const DeserializerProvider &provider) const;
    [[nodiscard]] virtual ExpectedDeserializer ConstructArrayDeserializer(const DeserializationConfig &config,
                                                                          const TypeDescriptor &type,
                                                                          const DeserializerProvider &provider) const;
    [[nodiscard]] virtual ExpectedDeserializer ConstructEnumDeserializer(const DeserializationConfig &config,
                                                                         const TypeDescriptor &type,
                                                                         const DeserializerProvider &provider) const;

    // Validates an extension request and returns the extended list. `constructible`
    // is the exact dynamic type the caller knows how to rebuild.
    [[nodiscard]] std::expected<DeserializersList, Error> ExtendedDeserializers(
        const std::shared_ptr<const Deserializers> &additional, const std::type_info &constructible) const;

  private:
    DeserializersList m_additional;
  };

} // namespace Bindery
