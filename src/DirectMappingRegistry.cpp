#include <Bindery/DirectMappingRegistry.hpp>

#include <utility>

namespace Bindery
{

  bool DirectMappingRegistry::Register(const TypeKey &key, DeserializerPtr deserializer)
  {
    return m_mappings.InsertOrAssign(key, std::move(deserializer));
  }

  DeserializerPtr DirectMappingRegistry::Find(const TypeKey &key) const
  {
    if (auto *p = m_mappings.GetPtr(key))
      return *p;
    return {};
  }

} // namespace Bindery
