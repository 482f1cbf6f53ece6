// DeserializerProvider.hpp
// Entry point for callers: dispatches a type to the factory entry point of its category
#pragma once

#include <Bindery/Config.hpp>
#include <Bindery/DeserializerFactory.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/Types.hpp>

#include <memory>
#include <utility>

namespace Bindery
{

  // Holds no cache; safe to share once the factory is configured.
  class BINDERY_API DeserializerProvider
  {
  public:
    explicit DeserializerProvider(std::shared_ptr<const DeserializerFactory> factory) : m_factory(std::move(factory)) {}

    [[nodiscard]] ExpectedDeserializer FindValueDeserializer(const DeserializationConfig &config,
                                                             const TypeDescriptor &type) const;

    template <class T>
    [[nodiscard]] ExpectedDeserializer FindValueDeserializer(const DeserializationConfig &config) const
    {
      return FindValueDeserializer(config, TypeDescriptor::Of<T>());
    }

    [[nodiscard]] const std::shared_ptr<const DeserializerFactory> &Factory() const noexcept { return m_factory; }

    [[nodiscard]] DeserializerProvider WithFactory(std::shared_ptr<const DeserializerFactory> factory) const
    {
      return DeserializerProvider{std::move(factory)};
    }

  private:
    std::shared_ptr<const DeserializerFactory> m_factory;
  };

} // namespace Bindery
