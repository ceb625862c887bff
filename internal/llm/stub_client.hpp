#pragma once

#include "internal/llm/provider_client.hpp"

namespace forge::llm {

/*
  Canned provider used when no wire client is plugged in. Returns a fixed
  JSON document and reports no usage, so the gateway falls back to its
  token estimate.
*/
class StubProviderClient final : public ProviderClient {
 public:
  ProviderReply Send(const std::string& system_prompt, const std::string& user_prompt, const std::string& api_key) override;
};

} // namespace forge::llm
