#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <Bindery/CustomDeserializerFactory.hpp>
#include <Bindery/Deserializers.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/MixInRegistry.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace Bindery
{

  /**
   * Named bundle of deserializers and mix-in overlays, installed on a factory in a
   * single step. The module id is derived from the name so diagnostics can
   * attribute an extension to the module that contributed it.
   */
  class BINDERY_API SimpleModule
  {
  public:
    explicit SimpleModule(std::string_view moduleName)
        : m_moduleName(moduleName),
          m_moduleId(NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size()))
    {
    }

    [[nodiscard]] std::string_view ModuleName() const noexcept
    {
      return m_moduleName;
    }

    [[nodiscard]] ModuleId GetModuleId() const noexcept
    {
      return m_moduleId;
    }

    /** Register a deserializer for exactly T. */
    template <class T, class D>
      requires detail::MappableTo<D, T>
    [[nodiscard]] std::expected<void, Error> AddDeserializer(std::shared_ptr<D> deserializer)
    {
      return m_deserializers.AddDeserializer<T>(std::move(deserializer));
    }

    /** Record that Source's annotations supplement Destination's. */
    template <class Destination, class Source>
    SimpleModule &SetMixInAnnotation()
    {
      (void)m_mixIns.Set(TypeKey::Of<Destination>(), TypeKey::Of<Source>());
      return *this;
    }

    [[nodiscard]] NGIN::UIntSize DeserializerCount() const noexcept { return m_deserializers.Size(); }
    [[nodiscard]] NGIN::UIntSize MixInCount() const noexcept { return m_mixIns.Size(); }

    /**
     * Returns a new factory with this module's deserializers as one extension and
     * its mix-ins added to the overlay registry. `factory` is not modified; later
     * changes to the module do not reach factories it was installed on.
     */
    [[nodiscard]] ExpectedFactory SetupModule(const CustomDeserializerFactory &factory) const;

  private:
    std::string m_moduleName;
    ModuleId m_moduleId{0};
    SimpleDeserializers m_deserializers;
    MixInRegistry m_mixIns;
  };

} // namespace Bindery
