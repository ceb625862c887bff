#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/llm/agent_prompts.hpp"
#include "internal/llm/gateway.hpp"
#include "internal/llm/output_parser.hpp"
#include "internal/llm/provider.hpp"
#include "internal/llm/stub_client.hpp"
#include "internal/security/credential_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace forge::llm;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-12;
}

class ScriptedClient final : public ProviderClient {
 public:
  ProviderReply Send(const std::string& system_prompt, const std::string& user_prompt, const std::string& api_key) override {
    last_system = system_prompt;
    last_user   = user_prompt;
    last_key    = api_key;
    if (fail) throw std::runtime_error("HTTP 429");
    return reply;
  }

  ProviderReply reply;
  bool          fail = false;

  std::string last_system;
  std::string last_user;
  std::string last_key;
};

GenerationRequest Request(const std::string& provider, const std::string& role = "Architect") {
  GenerationRequest request;
  request.provider = provider;
  request.role     = role;
  request.prompt   = "design a parser";
  request.secret   = "sk-test";
  return request;
}

// ------------------------------------------------------------
// Pricing and roles
// ------------------------------------------------------------

void TestProviderNamesAreExact() {
  assert(ParseProvider("Anthropic") == ProviderType::kAnthropic);
  assert(ParseProvider("OpenAI") == ProviderType::kOpenAI);
  assert(!ParseProvider("openai").has_value());
  assert(!ParseProvider("Foo").has_value());
  assert(ProviderName(ProviderType::kOpenAI) == "OpenAI");
}

void TestPricingTable() {
  assert(Near(CalculateCost(ProviderType::kAnthropic, 1'000'000, 0), 3.0));
  assert(Near(CalculateCost(ProviderType::kAnthropic, 0, 1'000'000), 15.0));
  assert(Near(CalculateCost(ProviderType::kOpenAI, 1'000'000, 1'000'000), 20.0));
  assert(Near(CalculateCost(ProviderType::kAnthropic, 100, 50), 0.00105));
  assert(CalculateCost(ProviderType::kOpenAI, 0, 0) == 0.0);
}

void TestRoleAliasesResolve() {
  assert(ResolveRole("Architect") == std::string("Architect"));
  assert(ResolveRole(" planner ") == std::string("Architect"));
  assert(ResolveRole("DEV") == std::string("Implementation"));
  assert(ResolveRole("qa") == std::string("Test"));
  assert(ResolveRole("auditor") == std::string("Optimizer"));
  assert(!ResolveRole("bard").has_value());
  assert(CanonicalRoles().size() == 4);

  for (const auto& role : CanonicalRoles()) {
    const auto prompt = SystemPromptFor(role);
    assert(prompt.has_value() && !prompt->empty());
  }
  assert(!SystemPromptFor("bard").has_value());
}

// ------------------------------------------------------------
// Output parsing
// ------------------------------------------------------------

void TestOutputParsing() {
  assert(CleanOutput("\x1b[32mok\x1b[0m") == "ok");

  const auto json = ExtractJson("Sure! {\"a\": 1}\nthen ```{\"b\": {\"c\": 2}}``` done");
  assert(json.has_value());
  assert(*json == "{\"b\": {\"c\": 2}}");
  assert(!ExtractJson("no braces here").has_value());

  const auto [in, out] = ExtractTokenCount("...\nINPUT TOKENS: 120\noutput tokens:  45\n");
  assert(in == 120);
  assert(out == 45);

  const auto [none_in, none_out] = ExtractTokenCount("nothing");
  assert(none_in == 0 && none_out == 0);

  const auto [big_in, big_out] = ExtractTokenCount("input tokens: 3000000000\noutput tokens: 123456789012345678901234");
  assert(big_in == std::numeric_limits<std::int32_t>::max());
  assert(big_out == std::numeric_limits<std::int32_t>::max());

  assert(EstimateTokens("") == 0);
  assert(EstimateTokens("abcd") == 1);
  assert(EstimateTokens("abcde") == 2);
}

// ------------------------------------------------------------
// Gateway
// ------------------------------------------------------------

void TestGatewayUsesReportedUsage() {
  auto client   = std::make_shared<ScriptedClient>();
  client->reply = {"\x1b[1mHere you go:\x1b[0m {\"plan\": [1, 2]}", 100, 50};

  Gateway gateway({{ProviderType::kAnthropic, client}});
  const auto result = gateway.Execute(Request("Anthropic", "planner"));

  assert(result.text == "{\"plan\": [1, 2]}");
  assert(result.input_tokens == 100);
  assert(result.output_tokens == 50);
  assert(Near(result.cost, 0.00105));
  assert(client->last_key == "sk-test");
  assert(client->last_user == "design a parser");
  assert(client->last_system == *SystemPromptFor("Architect"));
}

void TestGatewayFallsBackToMarkersThenEstimate() {
  auto client   = std::make_shared<ScriptedClient>();
  client->reply = {"done\nInput Tokens: 10\nOutput Tokens: 20\n", 0, 0};

  Gateway gateway({{ProviderType::kOpenAI, client}});
  auto    result = gateway.Execute(Request("OpenAI"));
  assert(result.input_tokens == 10);
  assert(result.output_tokens == 20);

  client->reply = {"{\"ok\": true}", 0, 0};
  result        = gateway.Execute(Request("OpenAI"));
  assert(result.input_tokens > 0);
  assert(result.output_tokens == EstimateTokens("{\"ok\": true}"));
  assert(result.cost > 0.0);
}

void TestGatewayErrors() {
  auto client  = std::make_shared<ScriptedClient>();
  client->fail = true;
  Gateway gateway({{ProviderType::kAnthropic, client}});

  bool threw = false;
  try {
    (void)gateway.Execute(Request("Anthropic"));
  } catch (const forge::util::GenerationError& ex) {
    threw = std::string(ex.what()).find("HTTP 429") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)gateway.Execute(Request("Foo"));
  } catch (const forge::util::UnsupportedProvider&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)gateway.Execute(Request("OpenAI"));
  } catch (const forge::util::GenerationError&) {
    threw = true;
  }
  assert(threw && "provider without a client must fail");

  threw = false;
  try {
    (void)gateway.Execute(Request("Anthropic", "bard"));
  } catch (const forge::util::GenerationError& ex) {
    threw = std::string(ex.what()).find("unknown agent role") != std::string::npos;
  }
  assert(threw);
}

void TestStubClientProducesJson() {
  Gateway gateway({{ProviderType::kAnthropic, std::make_shared<StubProviderClient>()}});

  const auto result = gateway.Execute(Request("Anthropic", "Test"));
  assert(result.text.front() == '{');
  assert(result.text.find("stub response") != std::string::npos);
  assert(result.input_tokens > 0 && result.output_tokens > 0);
}

// ------------------------------------------------------------
// Credentials
// ------------------------------------------------------------

void TestCredentialStores() {
  using forge::security::EnvCredentialStore;
  using forge::security::MemoryCredentialStore;

  assert(EnvCredentialStore::VariableFor("OpenAI") == "FORGE_OPENAI_API_KEY");
  assert(EnvCredentialStore::VariableFor("my-provider") == "FORGE_MY_PROVIDER_API_KEY");

  EnvCredentialStore env;
  ::setenv("FORGE_ANTHROPIC_API_KEY", "sk-ant", 1);
  assert(env.Get("Anthropic") == std::string("sk-ant"));
  ::setenv("FORGE_ANTHROPIC_API_KEY", "", 1);
  assert(!env.Get("Anthropic").has_value());
  ::unsetenv("FORGE_ANTHROPIC_API_KEY");
  assert(!env.Get("Anthropic").has_value());

  MemoryCredentialStore memory;
  assert(!memory.Get("OpenAI").has_value());
  memory.Set("OpenAI", "sk-oai");
  assert(memory.Get("OpenAI") == std::string("sk-oai"));
  memory.Remove("OpenAI");
  assert(!memory.Get("OpenAI").has_value());
}

} // namespace

int main() {
  TestProviderNamesAreExact();
  TestPricingTable();
  TestRoleAliasesResolve();
  TestOutputParsing();
  TestGatewayUsesReportedUsage();
  TestGatewayFallsBackToMarkersThenEstimate();
  TestGatewayErrors();
  TestStubClientProducesJson();
  TestCredentialStores();

  std::cout << "forge_unit_gateway: pass\n";
  return 0;
}
