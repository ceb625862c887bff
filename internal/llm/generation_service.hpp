#pragma once

#include <cstdint>
#include <string>

namespace forge::llm {

struct GenerationRequest {
  std::string role;
  std::string prompt;
  std::string secret;
  std::string provider;
};

struct GenerationResult {
  std::string  text;
  std::int32_t input_tokens  = 0;
  std::int32_t output_tokens = 0;
  double       cost          = 0.0;
};

/*
  Runs one prompt against a provider.

  Throws util::UnsupportedProvider for a provider outside the known set and
  util::GenerationError for anything else that prevents a result.
*/
class GenerationService {
 public:
  virtual ~GenerationService() = default;

  virtual GenerationResult Execute(const GenerationRequest& request) = 0;
};

} // namespace forge::llm
