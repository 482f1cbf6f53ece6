#include <Bindery/Bindery.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <expected>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Demo {
  struct Money { long long cents{}; std::string currency{}; };
  struct Invoice { Money total{}; };
  struct PublicInvoice {};
  struct InvoiceAnnotations {};
  template<typename T>
  struct Box { T value; };

  class MoneyDeserializer : public Bindery::TypedDeserializer<Money> {
  public:
    std::expected<Money, Bindery::Error> DeserializeValue(std::string_view text,
                                                          const Bindery::DeserializationConfig &) const override {
      Money m{};
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), m.cents);
      if (ec != std::errc{})
        return std::unexpected(Bindery::Error{Bindery::ErrorCode::Malformed, "bad amount"});
      while (ptr != text.data() + text.size() && *ptr == ' ')
        ++ptr;
      m.currency.assign(ptr, text.data() + text.size());
      return m;
    }
  };
}

int main() {
  using namespace Bindery;
  spdlog::set_level(spdlog::level::debug);
  std::cout << "Library: " << LibraryName() << "\n";

  // Keys erase template arguments
  std::cout << "TypeKey<Box<int>>: " << TypeKey::Of<Demo::Box<int>>().Name() << "\n";
  std::cout << "TypeKey<std::vector<float>>: " << TypeKey::Of<std::vector<float>>().Name() << "\n";
  std::cout << "TypeKey<int[4]>: " << TypeKey::Of<int[4]>().Name() << "\n";

  auto factory = std::make_shared<CustomDeserializerFactory>();
  if (auto r = factory->AddSpecificMapping<Demo::Money>(std::make_shared<Demo::MoneyDeserializer>()); !r) {
    std::cerr << "mapping failed: " << r.error().message << "\n";
    return 1;
  }
  factory->AddMixInAnnotations<Demo::PublicInvoice, Demo::InvoiceAnnotations>();

  DeserializerProvider provider{factory};
  DeserializationConfig config{};

  auto deser = provider.FindValueDeserializer<Demo::Money>(config);
  if (!deser) {
    std::cerr << "lookup failed: " << deser.error().message << "\n";
    return 1;
  }
  auto value = deser.value()->Deserialize("1999 EUR", config);
  if (value) {
    const auto &m = value->Cast<Demo::Money>();
    std::cout << "Money: " << m.cents << " " << m.currency << "\n";
  }

  auto invoice = provider.FindValueDeserializer<Demo::Invoice>(config);
  if (!invoice)
    std::cout << "Invoice: " << ToString(invoice.error().code) << " (" << invoice.error().message << ")\n";

  if (auto mixIn = factory->FindMixInClassFor(TypeKey::Of<Demo::PublicInvoice>()))
    std::cout << "Mix-in for PublicInvoice: " << mixIn->Name() << "\n";

  // Extension with a null provider is rejected; the factory keeps working
  auto rejected = factory->WithAdditionalDeserializers(nullptr);
  if (!rejected)
    std::cout << "Rejected extension: " << rejected.error().message << "\n";

  return 0;
}
