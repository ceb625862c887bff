#include "stub_client.hpp"

#include <string>

namespace forge::llm {

ProviderReply StubProviderClient::Send(const std::string&, const std::string& user_prompt, const std::string&) {
  ProviderReply reply;
  reply.content =
      "{\n"
      "  \"status\": \"success\",\n"
      "  \"message\": \"stub response\",\n"
      "  \"data\": {\"generated\": true, \"model\": \"stub-model-v1\", \"prompt_chars\": " +
      std::to_string(user_prompt.size()) +
      "}\n"
      "}";
  return reply;
}

} // namespace forge::llm
