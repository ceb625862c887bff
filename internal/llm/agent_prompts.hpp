#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge::llm {

/*
  System prompts per agent role.

  Canonical roles: Architect, Implementation, Test, Optimizer. Informal
  aliases ("dev", "qa", "planner", ...) and case differences resolve to them.
*/
std::optional<std::string> ResolveRole(std::string_view role);

// nullopt for a role that resolves to nothing.
std::optional<std::string> SystemPromptFor(std::string_view role);

const std::vector<std::string>& CanonicalRoles();

} // namespace forge::llm
