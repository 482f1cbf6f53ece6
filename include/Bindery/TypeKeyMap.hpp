// TypeKeyMap.hpp
// Insertion-ordered table keyed by TypeKey: dense entry storage plus an id index
#pragma once

#include <Bindery/TypeKey.hpp>

#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Primitives.hpp>

#include <limits>
#include <utility>

namespace Bindery::detail
{

  struct TypeKeyId
  {
    NGIN::UInt64 operator()(const TypeKey &key) const noexcept { return key.Id(); }
  };

  /**
   * The index maps an id to the first entry carrying it. Entries whose names
   * differ but whose ids collide are chained through `next`, so every name keeps
   * its own slot and a lookup only succeeds on an exact name match.
   */
  template <class V, class IdOf = TypeKeyId>
  class TypeKeyMap
  {
  public:
    static constexpr NGIN::UInt32 NoEntry = std::numeric_limits<NGIN::UInt32>::max();

    struct Entry
    {
      TypeKey key;
      V value;
      NGIN::UInt32 next{NoEntry};
    };

    TypeKeyMap() = default;
    TypeKeyMap(const TypeKeyMap &other) { AppendFrom(other); }
    TypeKeyMap(TypeKeyMap &&) = default;
    TypeKeyMap &operator=(TypeKeyMap &&) = default;
    TypeKeyMap &operator=(const TypeKeyMap &other)
    {
      if (this != &other)
      {
        TypeKeyMap copy{other};
        *this = std::move(copy);
      }
      return *this;
    }

    // Last write wins. Returns true when an existing entry was replaced.
    bool InsertOrAssign(const TypeKey &key, V value)
    {
      const auto id = IdOf{}(key);
      const auto idx = static_cast<NGIN::UInt32>(m_entries.Size());
      auto *head = m_index.GetPtr(id);
      if (!head)
      {
        m_entries.PushBack(Entry{key, std::move(value), NoEntry});
        m_index.Insert(id, idx);
        return false;
      }

      NGIN::UInt32 cur = *head;
      for (;;)
      {
        auto &entry = m_entries[cur];
        if (entry.key.Name() == key.Name())
        {
          entry.value = std::move(value);
          return true;
        }
        if (entry.next == NoEntry)
          break;
        cur = entry.next;
      }
      m_entries.PushBack(Entry{key, std::move(value), NoEntry});
      m_entries[cur].next = idx;
      return false;
    }

    [[nodiscard]] const V *GetPtr(const TypeKey &key) const
    {
      const auto *head = m_index.GetPtr(IdOf{}(key));
      if (!head)
        return nullptr;
      for (NGIN::UInt32 cur = *head; cur != NoEntry; cur = m_entries[cur].next)
      {
        const auto &entry = m_entries[cur];
        if (entry.key.Name() == key.Name())
          return &entry.value;
      }
      return nullptr;
    }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }
    [[nodiscard]] const Entry &EntryAt(NGIN::UIntSize i) const { return m_entries[i]; }

  private:
    // Chains only link to later entries, so the first entry seen for an id is its head.
    void AppendFrom(const TypeKeyMap &other)
    {
      m_entries.Reserve(other.m_entries.Size());
      for (NGIN::UIntSize i = 0; i < other.m_entries.Size(); ++i)
      {
        const auto &entry = other.m_entries[i];
        m_entries.PushBack(entry);
        const auto id = IdOf{}(entry.key);
        if (!m_index.GetPtr(id))
          m_index.Insert(id, static_cast<NGIN::UInt32>(i));
      }
    }

    NGIN::Containers::Vector<Entry> m_entries;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_index;
  };

} // namespace Bindery::detail
