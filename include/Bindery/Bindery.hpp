#pragma once

#include <string_view>

#include <Bindery/Export.hpp>
#include <Bindery/Types.hpp>
#include <Bindery/Config.hpp>
#include <Bindery/TypeDescriptor.hpp>
#include <Bindery/TypeKey.hpp>
#include <Bindery/Deserializer.hpp>
#include <Bindery/Deserializers.hpp>
#include <Bindery/DirectMappingRegistry.hpp>
#include <Bindery/MixInRegistry.hpp>
#include <Bindery/DeserializerFactory.hpp>
#include <Bindery/BasicDeserializerFactory.hpp>
#include <Bindery/CustomDeserializerFactory.hpp>
#include <Bindery/DeserializerProvider.hpp>
#include <Bindery/Module.hpp>

namespace Bindery
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Bindery"; }

} // namespace Bindery
