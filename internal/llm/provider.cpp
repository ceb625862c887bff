#include "provider.hpp"

namespace forge::llm {

namespace {

struct Pricing {
  double input_per_million;
  double output_per_million;
};

Pricing PricingFor(ProviderType provider) {
  switch (provider) {
    case ProviderType::kAnthropic:
      return {3.00, 15.00};
    case ProviderType::kOpenAI:
      return {5.00, 15.00};
  }
  return {0.0, 0.0};
}

} // namespace

std::optional<ProviderType> ParseProvider(std::string_view name) {
  if (name == "Anthropic") return ProviderType::kAnthropic;
  if (name == "OpenAI") return ProviderType::kOpenAI;
  return std::nullopt;
}

std::string_view ProviderName(ProviderType provider) {
  switch (provider) {
    case ProviderType::kAnthropic:
      return "Anthropic";
    case ProviderType::kOpenAI:
      return "OpenAI";
  }
  return "unknown";
}

double CalculateCost(ProviderType provider, std::int32_t input_tokens, std::int32_t output_tokens) {
  const auto pricing = PricingFor(provider);
  return (static_cast<double>(input_tokens) * pricing.input_per_million + static_cast<double>(output_tokens) * pricing.output_per_million) / 1'000'000.0;
}

} // namespace forge::llm
