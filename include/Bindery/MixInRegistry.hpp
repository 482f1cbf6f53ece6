// MixInRegistry.hpp
// Storage for mix-in annotation overlays and the lookup interface offered to introspection
#pragma once

#include <Bindery/Export.hpp>
#include <Bindery/TypeKey.hpp>
#include <Bindery/TypeKeyMap.hpp>

#include <NGIN/Primitives.hpp>

#include <optional>

namespace Bindery
{

  // Queried by an introspection engine for the type whose annotations supplement
  // `destination`. How supertypes are walked is entirely up to the caller.
  class BINDERY_API MixInResolver
  {
  public:
    virtual ~MixInResolver() = default;
    [[nodiscard]] virtual std::optional<TypeKey> FindMixInClassFor(const TypeKey &destination) const = 0;
  };

  // destination -> source. Pure storage; last write wins.
  class BINDERY_API MixInRegistry
  {
  public:
    // Returns true if an earlier overlay for `destination` was replaced.
    bool Set(const TypeKey &destination, const TypeKey &source);
    [[nodiscard]] std::optional<TypeKey> Find(const TypeKey &destination) const;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_overlays.Size(); }
    [[nodiscard]] const TypeKey &DestinationAt(NGIN::UIntSize i) const { return m_overlays.EntryAt(i).key; }
    [[nodiscard]] const TypeKey &SourceAt(NGIN::UIntSize i) const { return m_overlays.EntryAt(i).value; }

  private:
    detail::TypeKeyMap<TypeKey> m_overlays;
  };

} // namespace Bindery
