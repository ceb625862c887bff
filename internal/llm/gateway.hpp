#pragma once

#include <map>
#include <memory>

#include "internal/llm/generation_service.hpp"
#include "internal/llm/provider.hpp"
#include "internal/llm/provider_client.hpp"

namespace forge::llm {

/*
  GenerationService that routes by provider.

    1. resolve the system prompt from the agent role
    2. send through the provider's client
    3. strip ANSI noise, keep the trailing JSON block if there is one
    4. fill in usage from markers or an estimate when the client reports none
    5. price the call
*/
class Gateway final : public GenerationService {
 public:
  using ClientMap = std::map<ProviderType, std::shared_ptr<ProviderClient>>;

  explicit Gateway(ClientMap clients);

  GenerationResult Execute(const GenerationRequest& request) override;

 private:
  ClientMap clients_;
};

} // namespace forge::llm
