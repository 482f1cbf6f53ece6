#include <Bindery/BasicDeserializerFactory.hpp>
#include <Bindery/NameUtils.hpp>
#include <Bindery/TypeKey.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace Bindery::detail
{

  DeserializersList InsertInList(const DeserializersList &list, std::shared_ptr<const Deserializers> item)
  {
    DeserializersList result;
    result.Reserve(list.Size() + 1);
    result.PushBack(std::move(item));
    for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      result.PushBack(list[i]);
    return result;
  }

} // namespace Bindery::detail

namespace Bindery
{

  namespace
  {
    Error NoDeserializerFor(const TypeDescriptor &type)
    {
      return Error{ErrorCode::NotFound, "no " + std::string{ToString(type.Category())} +
                                            " deserializer constructible for type " + std::string{type.FullName()}};
    }
  } // namespace

  BasicDeserializerFactory::BasicDeserializerFactory(DeserializersList additional)
      : m_additional(std::move(additional))
  {
  }

  std::expected<DeserializersList, Error> BasicDeserializerFactory::ExtendedDeserializers(
      const std::shared_ptr<const Deserializers> &additional, const std::type_info &constructible) const
  {
    if (!additional)
    {
      spdlog::warn("[DeserializerFactory] Rejected null Deserializers");
      return std::unexpected(Error{ErrorCode::InvalidArgument, "can not pass null Deserializers"});
    }
    if (typeid(*this) != constructible)
    {
      const auto name = detail::DemangledName(typeid(*this));
      spdlog::warn("[DeserializerFactory] Factory subtype '{}' can not be rebuilt with additional deserializers", name);
      return std::unexpected(Error{ErrorCode::InvalidState,
                                   "factory subtype (" + name +
                                       ") has not overridden 'WithAdditionalDeserializers': can not instantiate subtype "
                                       "with additional deserializer definitions"});
    }
    spdlog::debug("[DeserializerFactory] Adding Deserializers extension ({} already registered)", m_additional.Size());
    return detail::InsertInList(m_additional, additional);
  }

  ExpectedFactory BasicDeserializerFactory::WithAdditionalDeserializers(std::shared_ptr<const Deserializers> additional) const
  {
    auto list = ExtendedDeserializers(additional, typeid(BasicDeserializerFactory));
    if (!list.has_value())
      return std::unexpected(list.error());
    return std::make_shared<BasicDeserializerFactory>(std::move(list.value()));
  }

  ExpectedDeserializer BasicDeserializerFactory::CreateBeanDeserializer(const DeserializationConfig &config,
                                                                        const TypeDescriptor &type,
                                                                        const DeserializerProvider &provider) const
  {
    for (NGIN::UIntSize i = 0; i < m_additional.Size(); ++i)
    {
      if (auto deser = m_additional[i]->FindBeanDeserializer(type, config, provider))
        return deser;
    }
    return ConstructBeanDeserializer(config, type, provider);
  }

  ExpectedDeserializer BasicDeserializerFactory::CreateArrayDeserializer(const DeserializationConfig &config,
                                                                         const TypeDescriptor &type,
                                                                         const DeserializerProvider &provider) const
  {
    for (NGIN::UIntSize i = 0; i < m_additional.Size(); ++i)
    {
      if (auto deser = m_additional[i]->FindArrayDeserializer(type, config, provider))
        return deser;
    }
    return ConstructArrayDeserializer(config, type, provider);
  }

  ExpectedDeserializer BasicDeserializerFactory::CreateEnumDeserializer(const DeserializationConfig &config,
                                                                        const TypeDescriptor &type,
                                                                        const DeserializerProvider &provider) const
  {
    for (NGIN::UIntSize i = 0; i < m_additional.Size(); ++i)
    {
      if (auto deser = m_additional[i]->FindEnumDeserializer(type, config, provider))
        return deser;
    }
    return ConstructEnumDeserializer(config, type, provider);
  }

  ExpectedDeserializer BasicDeserializerFactory::ConstructBeanDeserializer(const DeserializationConfig &,
                                                                           const TypeDescriptor &type,
                                                                           const DeserializerProvider &) const
  {
    return std::unexpected(NoDeserializerFor(type));
  }

  ExpectedDeserializer BasicDeserializerFactory::ConstructArrayDeserializer(const DeserializationConfig &,
                                                                            const TypeDescriptor &type,
                                                                            const DeserializerProvider &) const
  {
    return std::unexpected(NoDeserializerFor(type));
  }

  ExpectedDeserializer BasicDeserializerFactory::ConstructEnumDeserializer(const DeserializationConfig &,
                                                                           const TypeDescriptor &type,
                                                                           const DeserializerProvider &) const
  {
    return std::unexpected(NoDeserializerFor(type));
  }

} // namespace Bindery
