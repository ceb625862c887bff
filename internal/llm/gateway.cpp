#include "gateway.hpp"

#include <stdexcept>
#include <tuple>
#include <utility>

#include "internal/llm/agent_prompts.hpp"
#include "internal/llm/output_parser.hpp"
#include "internal/util/errors.hpp"

namespace forge::llm {

Gateway::Gateway(ClientMap clients) : clients_(std::move(clients)) {
}

GenerationResult Gateway::Execute(const GenerationRequest& request) {
  const auto system_prompt = SystemPromptFor(request.role);
  if (!system_prompt) {
    throw util::GenerationError("unknown agent role: " + request.role);
  }

  const auto provider = ParseProvider(request.provider);
  if (!provider) {
    throw util::UnsupportedProvider("unsupported provider: " + request.provider);
  }

  auto it = clients_.find(*provider);
  if (it == clients_.end() || !it->second) {
    throw util::GenerationError("no client configured for provider " + request.provider);
  }

  ProviderReply reply;
  try {
    reply = it->second->Send(*system_prompt, request.prompt, request.secret);
  } catch (const util::GenerationError&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::GenerationError(std::string(ProviderName(*provider)) + " request failed: " + ex.what());
  }

  GenerationResult result;
  result.text = CleanOutput(reply.content);
  if (auto json = ExtractJson(result.text)) {
    result.text = std::move(*json);
  }

  result.input_tokens  = reply.input_tokens;
  result.output_tokens = reply.output_tokens;
  if (result.input_tokens == 0 && result.output_tokens == 0) {
    std::tie(result.input_tokens, result.output_tokens) = ExtractTokenCount(reply.content);
  }
  if (result.input_tokens == 0 && result.output_tokens == 0) {
    result.input_tokens  = EstimateTokens(*system_prompt) + EstimateTokens(request.prompt);
    result.output_tokens = EstimateTokens(result.text);
  }

  result.cost = CalculateCost(*provider, result.input_tokens, result.output_tokens);
  return result;
}

} // namespace forge::llm
