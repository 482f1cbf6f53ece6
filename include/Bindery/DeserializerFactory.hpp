// DeserializerFactory.hpp
// Factory interface: one creation entry point per category plus immutable extension
#pragma once

#include <Bindery/Config.hpp>
#include <Bindery/Export.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/Types.hpp>

#include <memory>

namespace Bindery
{

  class BINDERY_API DeserializerFactory
  {
  public:
    virtual ~DeserializerFactory() = default;

    // Returns a new factory that also consults `additional`; this instance is left unchanged.
    [[nodiscard]] virtual ExpectedFactory WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const = 0;

    [[nodiscard]] virtual ExpectedDeserializer CreateBeanDeserializer(const DeserializationConfig &config,
                                                                      const TypeDescriptor &type,
                                                                      const DeserializerProvider &provider) const = 0;
    [[nodiscard]] virtual ExpectedDeserializer CreateArrayDeserializer(const DeserializationConfig &config,
                                                                       const TypeDescriptor &type,
                                                                       const DeserializerProvider &provider) const = 0;
    [[nodiscard]] virtual ExpectedDeserializer CreateEnumDeserializer(const DeserializationConfig &config,
                                                                      const TypeDescriptor &type,
                                                                      const DeserializerProvider &provider) const = 0;
  };

} // namespace Bindery
