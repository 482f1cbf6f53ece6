#include <iostream>
#include <expected>
#include <memory>
#include <string_view>

#include <NGIN/Benchmark.hpp>
#include <Bindery/Bindery.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Money
  {
    long long cents{0};
  };
  struct Price
  {
    Money amount{};
  };
  enum class Tier
  {
    Free,
    Paid
  };
  template <class T>
  struct Wrapper
  {
    T value{};
  };

  template <class T>
  class ConstantDeserializer : public Bindery::TypedDeserializer<T>
  {
  public:
    std::expected<T, Bindery::Error> DeserializeValue(std::string_view, const Bindery::DeserializationConfig &) const override
    {
      return T{};
    }
  };
}

int main()
{
  using namespace Bindery;
  using namespace BenchDemo;

  auto factory = std::make_shared<CustomDeserializerFactory>();
  (void)factory->AddSpecificMapping<Money>(std::make_shared<ConstantDeserializer<Money>>());
  (void)factory->AddSpecificMapping<Tier>(std::make_shared<ConstantDeserializer<Tier>>());
  (void)factory->AddSpecificMapping<Wrapper<int>>(std::make_shared<ConstantDeserializer<Wrapper<int>>>());

  auto extension = std::make_shared<SimpleDeserializers>();
  (void)extension->AddDeserializer<Price>(std::make_shared<ConstantDeserializer<Price>>());
  auto extended = factory->WithAdditionalDeserializers(extension).value();

  const DeserializerProvider direct{factory};
  const DeserializerProvider chained{extended};
  const DeserializationConfig config{};
  const auto moneyDesc = TypeDescriptor::Of<Money>();
  const auto priceDesc = TypeDescriptor::Of<Price>();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UInt64 acc = 0;
    for (int i=0;i<100000;++i) {
      acc ^= TypeKey::Of<Wrapper<double>>().Id();
    }
    ctx.doNotOptimize(acc);
    ctx.stop(); }, "TypeKey::Of<Wrapper<double>> 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int i=0;i<100000;++i) {
      auto d = direct.FindValueDeserializer(config, moneyDesc);
      hits += d.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "Specific mapping hit 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int i=0;i<100000;++i) {
      auto d = chained.FindValueDeserializer(config, priceDesc);
      hits += d.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "Extension fallthrough 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int misses = 0;
    for (int i=0;i<100000;++i) {
      auto d = direct.FindValueDeserializer<Wrapper<Price>>(config);
      misses += d.has_value() ? 0 : 1;
    }
    ctx.doNotOptimize(misses);
    ctx.stop(); }, "Unresolved miss 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UIntSize total = 0;
    for (int i=0;i<1000;++i) {
      auto f = factory->WithAdditionalDeserializers(extension);
      total += f.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(total);
    ctx.stop(); }, "WithAdditionalDeserializers 1k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
