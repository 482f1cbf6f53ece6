#include <Bindery/MixInRegistry.hpp>

namespace Bindery
{

  bool MixInRegistry::Set(const TypeKey &destination, const TypeKey &source)
  {
    return m_overlays.InsertOrAssign(destination, source);
  }

  std::optional<TypeKey> MixInRegistry::Find(const TypeKey &destination) const
  {
    if (auto *p = m_overlays.GetPtr(destination))
      return *p;
    return std::nullopt;
  }

} // namespace Bindery
