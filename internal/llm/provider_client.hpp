#pragma once

#include <cstdint>
#include <string>

namespace forge::llm {

struct ProviderReply {
  std::string  content;
  std::int32_t input_tokens  = 0;
  std::int32_t output_tokens = 0;
};

/*
  Wire client for one provider. Implementations throw on transport or API
  errors; the gateway turns those into util::GenerationError.
*/
class ProviderClient {
 public:
  virtual ~ProviderClient() = default;

  virtual ProviderReply Send(const std::string& system_prompt, const std::string& user_prompt, const std::string& api_key) = 0;
};

} // namespace forge::llm
