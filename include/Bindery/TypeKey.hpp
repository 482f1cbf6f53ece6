// TypeKey.hpp
// Canonical, value-comparable type identity used as the key of every registry
#pragma once

#include <Bindery/Export.hpp>
#include <Bindery/TypeDescriptor.hpp>

#include <NGIN/Primitives.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace Bindery
{

  /**
   * Identity of a raw type: the normalized name of a descriptor with all template
   * arguments erased, and its FNV-1a 64-bit id. Array keys are the element key
   * followed by "[]", so `int[4]`, `int[]` and `std::array<int, 4>` share a key.
   *
   * Equality is structural. Building a key touches no shared state, so keys may be
   * computed concurrently on the resolution path.
   */
  class BINDERY_API TypeKey
  {
  public:
    TypeKey() = default;

    [[nodiscard]] static TypeKey Of(const TypeDescriptor &type);

    template <class T>
    [[nodiscard]] static TypeKey Of()
    {
      return Of(TypeDescriptor::Of<T>());
    }

    // Key for a type spelled by name; the name is normalized first.
    [[nodiscard]] static TypeKey FromName(std::string_view name);

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] NGIN::UInt64 Id() const noexcept { return m_id; }
    [[nodiscard]] bool IsValid() const noexcept { return !m_name.empty(); }

    friend bool operator==(const TypeKey &a, const TypeKey &b) noexcept
    {
      return a.m_id == b.m_id && a.m_name == b.m_name;
    }

  private:
    explicit TypeKey(std::string normalizedName);

    std::string m_name;
    NGIN::UInt64 m_id{0};
  };

} // namespace Bindery

template <>
struct std::hash<Bindery::TypeKey>
{
  std::size_t operator()(const Bindery::TypeKey &key) const noexcept
  {
    return static_cast<std::size_t>(key.Id());
  }
};
