#include <Bindery/DeserializerProvider.hpp>

namespace Bindery
{

  ExpectedDeserializer DeserializerProvider::FindValueDeserializer(const DeserializationConfig &config,
                                                                   const TypeDescriptor &type) const
  {
    if (!m_factory)
      return std::unexpected(Error{ErrorCode::InvalidState, "deserializer provider has no factory"});
    switch (type.Category())
    {
    case TypeCategory::Array:
      return m_factory->CreateArrayDeserializer(config, type, *this);
    case TypeCategory::Enumerated:
      return m_factory->CreateEnumDeserializer(config, type, *this);
    case TypeCategory::Record:
      break;
    }
    return m_factory->CreateBeanDeserializer(config, type, *this);
  }

} // namespace Bindery
