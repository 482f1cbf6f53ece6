#include <Bindery/Deserializers.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace Bindery
{

  DeserializerPtr Deserializers::FindBeanDeserializer(const TypeDescriptor &, const DeserializationConfig &,
                                                      const DeserializerProvider &) const
  {
    return {};
  }

  DeserializerPtr Deserializers::FindArrayDeserializer(const TypeDescriptor &, const DeserializationConfig &,
                                                       const DeserializerProvider &) const
  {
    return {};
  }

  DeserializerPtr Deserializers::FindEnumDeserializer(const TypeDescriptor &, const DeserializationConfig &,
                                                      const DeserializerProvider &) const
  {
    return {};
  }

  std::expected<void, Error> SimpleDeserializers::AddDeserializer(const TypeKey &key, DeserializerPtr deserializer)
  {
    if (!deserializer)
    {
      spdlog::warn("[SimpleDeserializers] Rejected null deserializer for '{}'", key.Name());
      return std::unexpected(Error{ErrorCode::InvalidArgument, "can not add null deserializer for " + std::string{key.Name()}});
    }
    if (m_mappings.Register(key, std::move(deserializer)))
      spdlog::debug("[SimpleDeserializers] Replaced deserializer for '{}'", key.Name());
    return {};
  }

  DeserializerPtr SimpleDeserializers::FindBeanDeserializer(const TypeDescriptor &type, const DeserializationConfig &,
                                                            const DeserializerProvider &) const
  {
    return m_mappings.Find(TypeKey::Of(type));
  }

  DeserializerPtr SimpleDeserializers::FindArrayDeserializer(const TypeDescriptor &type, const DeserializationConfig &,
                                                             const DeserializerProvider &) const
  {
    return m_mappings.Find(TypeKey::Of(type));
  }

  DeserializerPtr SimpleDeserializers::FindEnumDeserializer(const TypeDescriptor &type, const DeserializationConfig &,
                                                            const DeserializerProvider &) const
  {
    return m_mappings.Find(TypeKey::Of(type));
  }

} // namespace Bindery
