#include <Bindery/Module.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace Bindery
{

  ExpectedFactory SimpleModule::SetupModule(const CustomDeserializerFactory &factory) const
  {
    spdlog::debug("[SimpleModule] Installing module '{}' (id {:#018x}, {} deserializers, {} mix-ins)", m_moduleName,
                  m_moduleId, m_deserializers.Size(), m_mixIns.Size());

    auto extended = factory.WithAdditionalDeserializers(std::make_shared<const SimpleDeserializers>(m_deserializers));
    if (!extended.has_value())
    {
      spdlog::error("[SimpleModule] Module '{}' (id {:#018x}) could not be installed: {}", m_moduleName, m_moduleId,
                    extended.error().message);
      return std::unexpected(extended.error());
    }

    if (m_mixIns.Size() != 0)
    {
      auto custom = std::dynamic_pointer_cast<CustomDeserializerFactory>(extended.value());
      if (!custom)
        return std::unexpected(Error{ErrorCode::InvalidState, "module '" + m_moduleName +
                                                                  "' declares mix-ins but the extended factory does "
                                                                  "not accept them"});
      for (NGIN::UIntSize i = 0; i < m_mixIns.Size(); ++i)
        custom->AddMixInAnnotations(m_mixIns.DestinationAt(i), m_mixIns.SourceAt(i));
    }
    return extended;
  }

} // namespace Bindery
