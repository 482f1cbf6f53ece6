// DirectMappingRegistry.hpp
// Exact-type deserializer overrides, consulted before any generic resolution
#pragma once

#include <Bindery/Export.hpp>
#include <Bindery/TypeKey.hpp>
#include <Bindery/TypeKeyMap.hpp>
#include <Bindery/Types.hpp>

#include <NGIN/Primitives.hpp>

namespace Bindery
{

  /**
   * Maps a TypeKey to the deserializer to use for exactly that type. There is no
   * subtype matching and no partition by creation category: one entry answers a
   * lookup from any factory entry point.
   *
   * Register only during configuration. Find is a pure read and may be called
   * concurrently once registration has stopped.
   */
  class BINDERY_API DirectMappingRegistry
  {
  public:
    // Returns true if an earlier mapping for `key` was replaced.
    bool Register(const TypeKey &key, DeserializerPtr deserializer);

    // Empty pointer when nothing is registered for `key`.
    [[nodiscard]] DeserializerPtr Find(const TypeKey &key) const;
    [[nodiscard]] bool Contains(const TypeKey &key) const { return m_mappings.GetPtr(key) != nullptr; }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_mappings.Size(); }
    [[nodiscard]] const TypeKey &KeyAt(NGIN::UIntSize i) const { return m_mappings.EntryAt(i).key; }
    [[nodiscard]] const DeserializerPtr &DeserializerAt(NGIN::UIntSize i) const { return m_mappings.EntryAt(i).value; }

  private:
    detail::TypeKeyMap<DeserializerPtr> m_mappings;
  };

} // namespace Bindery
