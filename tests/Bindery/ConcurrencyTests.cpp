// ConcurrencyTests.cpp — concurrent resolution against a fully configured factory

#include <catch2/catch_test_macros.hpp>

#include <Bindery/Bindery.hpp>

#include "TestDeserializers.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

TEST_CASE("ConcurrentResolutionMatchesSequential", "[bindery][Concurrency]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  auto configured = std::make_shared<CustomDeserializerFactory>();
  REQUIRE(configured->AddSpecificMapping<Money>(std::make_shared<MoneyDeserializer>()).has_value());
  REQUIRE(configured->AddSpecificMapping<Color>(std::make_shared<FixedDeserializer<Color>>(Color::Blue)).has_value());
  REQUIRE(configured->AddSpecificMapping<Box<int>>(std::make_shared<FixedDeserializer<Box<int>>>()).has_value());
  configured->AddMixInAnnotations<PublicApiView, InternalAnnotations>();

  auto extension = std::make_shared<SimpleDeserializers>();
  REQUIRE(extension->AddDeserializer<Price>(std::make_shared<FixedDeserializer<Price>>()).has_value());
  auto extended = configured->WithAdditionalDeserializers(extension);
  REQUIRE(extended.has_value());

  const std::shared_ptr<const DeserializerFactory> factory = extended.value();
  const DeserializerProvider provider{factory};
  const DeserializationConfig config{};

  const std::array<TypeDescriptor, 5> types{TypeDescriptor::Of<Money>(), TypeDescriptor::Of<Color>(),
                                            TypeDescriptor::Of<Box<double>>(), TypeDescriptor::Of<Price>(),
                                            TypeDescriptor::Of<Shape>()};

  std::array<DeserializerPtr, 5> baseline{};
  for (std::size_t i = 0; i < types.size(); ++i)
  {
    auto found = provider.FindValueDeserializer(config, types[i]);
    baseline[i] = found.has_value() ? found.value() : nullptr;
  }
  REQUIRE(baseline[0] != nullptr);
  REQUIRE(baseline[3] != nullptr);
  REQUIRE(baseline[4] == nullptr);

  constexpr int threadCount = 8;
  constexpr int iterations = 2000;
  std::atomic<int> mismatches{0};
  std::vector<std::thread> workers;
  workers.reserve(threadCount);
  for (int t = 0; t < threadCount; ++t)
  {
    workers.emplace_back([&, t] {
      for (int i = 0; i < iterations; ++i)
      {
        const std::size_t idx = static_cast<std::size_t>(t + i) % types.size();
        auto found = provider.FindValueDeserializer(config, types[idx]);
        const DeserializerPtr got = found.has_value() ? found.value() : nullptr;
        if (got != baseline[idx])
          mismatches.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (auto &w : workers)
    w.join();

  CHECK(mismatches.load() == 0);
}

TEST_CASE("ConcurrentMixInLookupsAreStable", "[bindery][Concurrency]")
{
  using namespace Bindery;
  using namespace BinderyTest;

  CustomDeserializerFactory factory;
  factory.AddMixInAnnotations<PublicApiView, InternalAnnotations>();
  const MixInResolver &resolver = factory;

  std::atomic<int> misses{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t)
  {
    workers.emplace_back([&] {
      for (int i = 0; i < 1000; ++i)
      {
        auto found = resolver.FindMixInClassFor(TypeKey::Of<PublicApiView>());
        if (!found || *found != TypeKey::Of<InternalAnnotations>())
          misses.fetch_add(1, std::memory_order_relaxed);
        if (resolver.FindMixInClassFor(TypeKey::Of<Money>()).has_value())
          misses.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (auto &w : workers)
    w.join();

  CHECK(misses.load() == 0);
}
