// TypeDescriptor.hpp
// Structural description of a type as seen by the deserializer factories
#pragma once

#include <Bindery/Export.hpp>
#include <Bindery/Types.hpp>

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <array>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace Bindery
{

  class TypeDescriptor;

  namespace detail
  {
    template <class T>
    struct IsStdArray : std::false_type
    {
    };
    template <class E, std::size_t N>
    struct IsStdArray<std::array<E, N>> : std::true_type
    {
    };

    // Collects type template arguments; non-type arguments are not described.
    template <class T>
    struct TemplateParameters
    {
      static void AppendTo(NGIN::Containers::Vector<std::shared_ptr<const TypeDescriptor>> &) {}
    };
    template <template <class...> class Tpl, class... A>
    struct TemplateParameters<Tpl<A...>>
    {
      static void AppendTo(NGIN::Containers::Vector<std::shared_ptr<const TypeDescriptor>> &out);
    };
  } // namespace detail

  /**
   * Describes a type by name, creation category and (for information only) its
   * template parameters. Array descriptors carry their element descriptor.
   *
   * Descriptors are built from C++ types with `Of<T>()` or at runtime for types
   * known only by name. They are plain values; copying shares the nested
   * parameter/element descriptors.
   */
  class BINDERY_API TypeDescriptor
  {
  public:
    TypeDescriptor() = default;

    template <class T>
    [[nodiscard]] static TypeDescriptor Of();

    [[nodiscard]] static TypeDescriptor Record(std::string_view name, std::initializer_list<TypeDescriptor> parameters = {});
    [[nodiscard]] static TypeDescriptor Enum(std::string_view name);
    [[nodiscard]] static TypeDescriptor ArrayOf(TypeDescriptor element);

    [[nodiscard]] std::string_view FullName() const noexcept { return m_fullName; }
    [[nodiscard]] TypeCategory Category() const noexcept { return m_category; }
    [[nodiscard]] bool IsArray() const noexcept { return m_category == TypeCategory::Array; }
    [[nodiscard]] bool IsEnum() const noexcept { return m_category == TypeCategory::Enumerated; }
    [[nodiscard]] bool IsValid() const noexcept { return !m_fullName.empty(); }

    [[nodiscard]] NGIN::UIntSize ParameterCount() const noexcept { return m_parameters.Size(); }
    [[nodiscard]] const TypeDescriptor &ParameterAt(NGIN::UIntSize i) const { return *m_parameters[i]; }

    // Element descriptor of an array type, nullptr otherwise.
    [[nodiscard]] const TypeDescriptor *ElementType() const noexcept { return m_element.get(); }

  private:
    TypeDescriptor(std::string_view fullName, TypeCategory category) : m_fullName(fullName), m_category(category) {}

    std::string m_fullName;
    TypeCategory m_category{TypeCategory::Record};
    NGIN::Containers::Vector<std::shared_ptr<const TypeDescriptor>> m_parameters;
    std::shared_ptr<const TypeDescriptor> m_element;
  };

  template <class T>
  TypeDescriptor TypeDescriptor::Of()
  {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_array_v<U>)
    {
      return ArrayOf(Of<std::remove_extent_t<U>>());
    }
    else if constexpr (detail::IsStdArray<U>::value)
    {
      return ArrayOf(Of<typename U::value_type>());
    }
    else if constexpr (std::is_enum_v<U>)
    {
      return Enum(NGIN::Meta::TypeName<U>::qualifiedName);
    }
    else
    {
      TypeDescriptor d{NGIN::Meta::TypeName<U>::qualifiedName, TypeCategory::Record};
      detail::TemplateParameters<U>::AppendTo(d.m_parameters);
      return d;
    }
  }

  namespace detail
  {
    template <template <class...> class Tpl, class... A>
    void TemplateParameters<Tpl<A...>>::AppendTo(NGIN::Containers::Vector<std::shared_ptr<const TypeDescriptor>> &out)
    {
      (out.PushBack(std::make_shared<const TypeDescriptor>(TypeDescriptor::Of<A>())), ...);
    }
  } // namespace detail

} // namespace Bindery
