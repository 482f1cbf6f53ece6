// ExtensionTests.cpp — immutable extension of factories with additional Deserializers

#include <catch2/catch_test_macros.hpp>

#include <Bindery/Bindery.hpp>

#include "TestDeserializers.hpp"

#include <memory>

TEST_CASE("WithAdditionalDeserializersLeavesOriginalUntouched", "[bindery][Extension]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  auto f0 = std::make_shared<CustomDeserializerFactory>();
  auto priceDeser = std::make_shared<FixedDeserializer<Price>>();
  auto p = std::make_shared<SimpleDeserializers>();
  REQUIRE(p->AddDeserializer<Price>(priceDeser).has_value());

  auto f1 = f0->WithAdditionalDeserializers(p);
  REQUIRE(f1.has_value());
  REQUIRE(f1.value() != nullptr);
  CHECK(f1.value().get() != f0.get());
  CHECK(f0->ExtensionCount() == NGIN::UIntSize{0});

  const DeserializationConfig config{};
  auto before = f0->CreateBeanDeserializer(config, TypeDescriptor::Of<Price>(), ProviderFor(f0));
  CHECK_FALSE(before.has_value());

  auto after = f1.value()->CreateBeanDeserializer(config, TypeDescriptor::Of<Price>(), ProviderFor(f1.value()));
  REQUIRE(after.has_value());
  CHECK(after.value() == priceDeser);
}

TEST_CASE("NullDeserializersAreRejected", "[bindery][Extension]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  CustomDeserializerFactory factory;
  auto money = std::make_shared<MoneyDeserializer>();
  REQUIRE(factory.AddSpecificMapping<Money>(money).has_value());

  auto result = factory.WithAdditionalDeserializers(nullptr);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);

  BasicDeserializerFactory base;
  auto baseResult = base.WithAdditionalDeserializers(nullptr);
  REQUIRE_FALSE(baseResult.has_value());
  CHECK(baseResult.error().code == ErrorCode::InvalidArgument);

  auto still = factory.CreateBeanDeserializer(DeserializationConfig{}, TypeDescriptor::Of<Money>(),
                                              ProviderFor(std::make_shared<BasicDeserializerFactory>()));
  REQUIRE(still.has_value());
  CHECK(still.value() == money);
}

TEST_CASE("ExtensionsAccumulateWithoutLoss", "[bindery][Extension]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  auto first = std::make_shared<SimpleDeserializers>();
  auto second = std::make_shared<SimpleDeserializers>();
  auto priceDeser = std::make_shared<FixedDeserializer<Price>>();
  auto colorDeser = std::make_shared<FixedDeserializer<Color>>(Color::Blue);
  REQUIRE(first->AddDeserializer<Price>(priceDeser).has_value());
  REQUIRE(second->AddDeserializer<Color>(colorDeser).has_value());

  BasicDeserializerFactory base;
  auto f1 = base.WithAdditionalDeserializers(first);
  REQUIRE(f1.has_value());
  auto f2 = f1.value()->WithAdditionalDeserializers(second);
  REQUIRE(f2.has_value());

  auto basic = std::dynamic_pointer_cast<BasicDeserializerFactory>(f2.value());
  REQUIRE(basic != nullptr);
  CHECK(basic->ExtensionCount() == NGIN::UIntSize{2});

  const auto provider = ProviderFor(f2.value());
  const DeserializationConfig config{};
  auto price = f2.value()->CreateBeanDeserializer(config, TypeDescriptor::Of<Price>(), provider);
  auto color = f2.value()->CreateEnumDeserializer(config, TypeDescriptor::Of<Color>(), provider);
  REQUIRE(price.has_value());
  REQUIRE(color.has_value());
  CHECK(price.value() == priceDeser);
  CHECK(color.value() == colorDeser);

  auto f1Basic = std::dynamic_pointer_cast<BasicDeserializerFactory>(f1.value());
  REQUIRE(f1Basic != nullptr);
  CHECK(f1Basic->ExtensionCount() == NGIN::UIntSize{1});
}

TEST_CASE("NewestExtensionIsConsultedFirst", "[bindery][Extension]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  auto older = std::make_shared<CatchAllDeserializers>(std::make_shared<FixedDeserializer<Price>>());
  auto newerDeser = std::make_shared<FixedDeserializer<Price>>();
  auto newer = std::make_shared<CatchAllDeserializers>(newerDeser);

  auto f1 = CustomDeserializerFactory{}.WithAdditionalDeserializers(older);
  REQUIRE(f1.has_value());
  auto f2 = f1.value()->WithAdditionalDeserializers(newer);
  REQUIRE(f2.has_value());

  auto result = f2.value()->CreateBeanDeserializer(DeserializationConfig{}, TypeDescriptor::Of<Price>(),
                                                   ProviderFor(f2.value()));
  REQUIRE(result.has_value());
  CHECK(result.value() == newerDeser);
  CHECK(newer->Calls() == 1);
  CHECK(older->Calls() == 0);
}

TEST_CASE("SpecificMappingsSurviveExtension", "[bindery][Extension]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  CustomDeserializerFactory factory;
  auto money = std::make_shared<MoneyDeserializer>();
  REQUIRE(factory.AddSpecificMapping<Money>(money).has_value());

  auto extended = factory.WithAdditionalDeserializers(std::make_shared<SimpleDeserializers>());
  REQUIRE(extended.has_value());
  auto custom = std::dynamic_pointer_cast<CustomDeserializerFactory>(extended.value());
  REQUIRE(custom != nullptr);
  CHECK(custom->DirectMappings().Find(TypeKey::Of<Money>()) == money);

  // Later configuration of either instance stays local to it.
  REQUIRE(custom->AddSpecificMapping<Price>(std::make_shared<FixedDeserializer<Price>>()).has_value());
  CHECK_FALSE(factory.DirectMappings().Contains(TypeKey::Of<Price>()));
}

TEST_CASE("SimpleDeserializersRejectNullDeserializer", "[bindery][Extension]")
{
  using namespace Bindery;

  SimpleDeserializers simple;
  auto result = simple.AddDeserializer(TypeKey::FromName("Ledger::Entry"), nullptr);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);
  CHECK(simple.Size() == NGIN::UIntSize{0});
}
