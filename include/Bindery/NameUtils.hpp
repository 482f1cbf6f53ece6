// NameUtils.hpp
// Type-name normalization used to build registry keys, and runtime type names for diagnostics.
#pragma once

#include <Bindery/Export.hpp>

#include <string>
#include <string_view>
#include <typeinfo>

namespace Bindery::detail
{

  // Erases every balanced `<...>` segment (brackets inside parentheses do not
  // nest), drops cv-qualifiers and the MSVC "class "/"struct "/"enum "/"union "
  // prefixes, and collapses whitespace so that only identifier tokens keep a
  // single separating space.
  //   "const ns::Box<int, ns::Pair<a, b>>::Inner" -> "ns::Box::Inner"
  //   "ns::Foo const*"                            -> "ns::Foo*"
  //   "unsigned  int"                             -> "unsigned int"
  [[nodiscard]] BINDERY_API std::string NormalizeTypeName(std::string_view name);

  // Human-readable name of a dynamic type (demangled on GCC/Clang).
  [[nodiscard]] BINDERY_API std::string DemangledName(const std::type_info &info);

} // namespace Bindery::detail
