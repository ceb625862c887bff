#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace forge::llm {

enum class ProviderType {
  kAnthropic,
  kOpenAI,
};

// Exact, case-sensitive match on the provider names the editor stores
// ("Anthropic", "OpenAI").
std::optional<ProviderType> ParseProvider(std::string_view name);

std::string_view ProviderName(ProviderType provider);

// USD, from the per-million-token rates of each provider.
double CalculateCost(ProviderType provider, std::int32_t input_tokens, std::int32_t output_tokens);

} // namespace forge::llm
