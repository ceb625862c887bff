#include "agent_prompts.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace forge::llm {

namespace {

constexpr const char* kArchitectPrompt =
    "You are the Forge Orchestrator Agent. Your role is to convert verbose, high-level user goals\n"
    "into concise, structured, actionable JSON contracts for specialized worker agents.\n"
    "Your focus is token efficiency, logical sequencing, and adherence to the project charter.\n"
    "DO NOT write code. DO NOT engage in conversation. ONLY output the requested JSON contract.\n";

constexpr const char* kImplementationPrompt =
    "You are a specialized Forge Implementation Agent (Developer).\n"
    "Your sole task is to implement the feature described in the contract provided by the Orchestrator.\n"
    "Your final output MUST include both the modified code files AND the tests that cover them.\n"
    "DO NOT ask questions or engage in conversation. If you fail, output a FAILURE_REPORT JSON.\n";

constexpr const char* kTestPrompt =
    "You are the Forge Test Agent (QA). Your sole job is to validate code and output.\n"
    "Prioritize user-visible behaviour and functional correctness over status codes.\n"
    "DO NOT write new code. DO NOT assume success. Critically analyze the provided code and test results.\n";

constexpr const char* kOptimizerPrompt =
    "You are the Forge Token Optimizer Agent. Your goal is to reduce operational cost and token waste.\n"
    "Analyze the provided execution log (flow id, model used, input/output tokens, failure reason).\n"
    "Your output MUST be a JSON object containing a 'suggestion' field and an 'estimated_savings' field.\n";

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

const std::unordered_map<std::string, std::string>& Aliases() {
  static const std::unordered_map<std::string, std::string> kAliases = {
      {"planner", "Architect"}, {"coder", "Implementation"}, {"developer", "Implementation"}, {"dev", "Implementation"},
      {"tester", "Test"},       {"qa", "Test"},              {"auditor", "Optimizer"},       {"optimizer", "Optimizer"},
  };
  return kAliases;
}

} // namespace

const std::vector<std::string>& CanonicalRoles() {
  static const std::vector<std::string> kRoles = {"Architect", "Implementation", "Test", "Optimizer"};
  return kRoles;
}

std::optional<std::string> ResolveRole(std::string_view role) {
  const auto normalized = Lower(Trim(role));

  if (auto it = Aliases().find(normalized); it != Aliases().end()) {
    return it->second;
  }

  for (const auto& canonical : CanonicalRoles()) {
    if (Lower(canonical) == normalized) {
      return canonical;
    }
  }

  return std::nullopt;
}

std::optional<std::string> SystemPromptFor(std::string_view role) {
  const auto resolved = ResolveRole(role);
  if (!resolved) return std::nullopt;

  if (*resolved == "Architect") return std::string(kArchitectPrompt);
  if (*resolved == "Implementation") return std::string(kImplementationPrompt);
  if (*resolved == "Test") return std::string(kTestPrompt);
  return std::string(kOptimizerPrompt);
}

} // namespace forge::llm
