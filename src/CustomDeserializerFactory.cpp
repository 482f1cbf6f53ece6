#include <Bindery/CustomDeserializerFactory.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace Bindery
{

  CustomDeserializerFactory::CustomDeserializerFactory(const CustomDeserializerFactory &other,
                                                       DeserializersList additional)
      : BasicDeserializerFactory(std::move(additional)),
        m_directClassMappings(other.m_directClassMappings),
        m_mixInAnnotations(other.m_mixInAnnotations)
  {
  }

  ExpectedFactory CustomDeserializerFactory::WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const
  {
    auto list = ExtendedDeserializers(additional, typeid(CustomDeserializerFactory));
    if (!list.has_value())
      return std::unexpected(list.error());
    return std::make_shared<CustomDeserializerFactory>(*this, std::move(list.value()));
  }

  std::expected<void, Error> CustomDeserializerFactory::AddSpecificMapping(const TypeDescriptor &type,
                                                                         DeserializerPtr deserializer)
  {
    const auto key = TypeKey::Of(type);
    if (!deserializer)
    {
      spdlog::warn("[CustomDeserializerFactory] Rejected null deserializer for '{}'", key.Name());
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   "can not map null deserializer for type " + std::string{type.FullName()}});
    }
    if (m_directClassMappings.Register(key, std::move(deserializer)))
      spdlog::debug("[CustomDeserializerFactory] Replaced specific mapping for '{}'", key.Name());
    else
      spdlog::debug("[CustomDeserializerFactory] Added specific mapping for '{}'", key.Name());
    return {};
  }

  void CustomDeserializerFactory::AddMixInAnnotations(const TypeDescriptor &destination, const TypeDescriptor &source)
  {
    AddMixInAnnotations(TypeKey::Of(destination), TypeKey::Of(source));
  }

  void CustomDeserializerFactory::AddMixInAnnotations(const TypeKey &destination, const TypeKey &source)
  {
    const bool replaced = m_mixInAnnotations.Set(destination, source);
    spdlog::debug("[CustomDeserializerFactory] {} mix-in '{}' for '{}'", replaced ? "Replaced" : "Added", source.Name(),
                  destination.Name());
  }

  std::optional<TypeKey> CustomDeserializerFactory::FindMixInClassFor(const TypeKey &destination) const
  {
    return m_mixInAnnotations.Find(destination);
  }

  DeserializerPtr CustomDeserializerFactory::FindDirectMapping(const TypeDescriptor &type) const
  {
    if (m_directClassMappings.Size() == 0)
      return {};
    const auto key = TypeKey::Of(type);
    auto deser = m_directClassMappings.Find(key);
    if (deser)
      spdlog::trace("[CustomDeserializerFactory] Specific mapping hit for '{}'", key.Name());
    return deser;
  }

  ExpectedDeserializer CustomDeserializerFactory::CreateBeanDeserializer(const DeserializationConfig &config,
                                                                         const TypeDescriptor &type,
                                                                         const DeserializerProvider &provider) const
  {
    if (auto deser = FindDirectMapping(type))
      return deser;
    return BasicDeserializerFactory::CreateBeanDeserializer(config, type, provider);
  }

  ExpectedDeserializer CustomDeserializerFactory::CreateArrayDeserializer(const DeserializationConfig &config,
                                                                          const TypeDescriptor &type,
                                                                          const DeserializerProvider &provider) const
  {
    if (auto deser = FindDirectMapping(type))
      return deser;
    return BasicDeserializerFactory::CreateArrayDeserializer(config, type, provider);
  }

  ExpectedDeserializer CustomDeserializerFactory::CreateEnumDeserializer(const DeserializationConfig &config,
                                                                         const TypeDescriptor &type,
                                                                         const DeserializerProvider &provider) const
  {
    if (auto deser = FindDirectMapping(type))
      return deser;
    return BasicDeserializerFactory::CreateEnumDeserializer(config, type, provider);
  }

} // namespace Bindery
