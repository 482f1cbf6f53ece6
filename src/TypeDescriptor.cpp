#include <Bindery/TypeDescriptor.hpp>

#include <memory>
#include <utility>

namespace Bindery
{

  TypeDescriptor TypeDescriptor::Record(std::string_view name, std::initializer_list<TypeDescriptor> parameters)
  {
    TypeDescriptor d{name, TypeCategory::Record};
    d.m_parameters.Reserve(parameters.size());
    for (const auto &p : parameters)
      d.m_parameters.PushBack(std::make_shared<const TypeDescriptor>(p));
    return d;
  }

  TypeDescriptor TypeDescriptor::Enum(std::string_view name)
  {
    return TypeDescriptor{name, TypeCategory::Enumerated};
  }

  TypeDescriptor TypeDescriptor::ArrayOf(TypeDescriptor element)
  {
    TypeDescriptor d{element.FullName(), TypeCategory::Array};
    d.m_fullName.append("[]");
    d.m_element = std::make_shared<const TypeDescriptor>(std::move(element));
    return d;
  }

} // namespace Bindery
