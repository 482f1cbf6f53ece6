#include <Bindery/NameUtils.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/TypeKey.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <utility>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace Bindery::detail
{

  namespace
  {
    bool IsIdentifierChar(char c) noexcept
    {
      return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool IsNameChar(char c) noexcept
    {
      return IsIdentifierChar(c) || c == ':';
    }

    bool IsDroppedToken(std::string_view token) noexcept
    {
      return token == "const" || token == "volatile" || token == "class" || token == "struct" || token == "enum" ||
             token == "union";
    }

    // Removes template argument lists. Angle brackets inside a parenthesized
    // argument are comparison operators, not nesting.
    std::string EraseTemplateArguments(std::string_view name)
    {
      std::string erased;
      erased.reserve(name.size());
      int depth = 0;
      int parens = 0;
      for (char c : name)
      {
        if (depth == 0)
        {
          if (c == '<')
            ++depth;
          else if (c != '>')
            erased.push_back(c);
          continue;
        }
        if (c == '(')
          ++parens;
        else if (c == ')' && parens > 0)
          --parens;
        else if (parens == 0 && c == '<')
          ++depth;
        else if (parens == 0 && c == '>')
          --depth;
      }
      return erased;
    }
  } // namespace

  std::string NormalizeTypeName(std::string_view name)
  {
    const std::string erased = EraseTemplateArguments(name);

    // Tokens are qualified names or single punctuation characters, so qualifiers
    // attached to '*', '&' or '[' are found the same way as free-standing ones.
    std::string out;
    out.reserve(erased.size());
    std::string_view rest{erased};
    while (!rest.empty())
    {
      if (std::isspace(static_cast<unsigned char>(rest.front())) != 0)
      {
        rest.remove_prefix(1);
        continue;
      }
      std::size_t len = 1;
      if (IsNameChar(rest.front()))
      {
        while (len < rest.size() && IsNameChar(rest[len]))
          ++len;
      }
      const auto token = rest.substr(0, len);
      rest.remove_prefix(len);
      if (IsDroppedToken(token))
        continue;
      if (!out.empty() && IsIdentifierChar(out.back()) && IsIdentifierChar(token.front()))
        out.push_back(' ');
      out.append(token);
    }
    return out;
  }

  std::string DemangledName(const std::type_info &info)
  {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled{abi::__cxa_demangle(info.name(), nullptr, nullptr, &status),
                                                      std::free};
    if (status == 0 && demangled)
      return std::string{demangled.get()};
#endif
    return std::string{info.name()};
  }

} // namespace Bindery::detail

namespace Bindery
{

  TypeKey::TypeKey(std::string normalizedName)
      : m_name(std::move(normalizedName)),
        m_id(NGIN::Hashing::FNV1a64(m_name.data(), m_name.size()))
  {
  }

  TypeKey TypeKey::Of(const TypeDescriptor &type)
  {
    if (type.IsArray() && type.ElementType() != nullptr)
    {
      auto element = Of(*type.ElementType());
      return TypeKey{element.m_name + "[]"};
    }
    return TypeKey{detail::NormalizeTypeName(type.FullName())};
  }

  TypeKey TypeKey::FromName(std::string_view name)
  {
    return TypeKey{detail::NormalizeTypeName(name)};
  }

} // namespace Bindery
