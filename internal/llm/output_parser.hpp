#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace forge::llm {

// Strips ANSI colour escapes.
std::string CleanOutput(const std::string& output);

// Last balanced {...} block, ignoring fences and chatter around it.
std::optional<std::string> ExtractJson(const std::string& output);

// Reads "Input Tokens: N" / "Output Tokens: N" markers (case-insensitive).
// Missing markers count as 0.
std::pair<std::int32_t, std::int32_t> ExtractTokenCount(const std::string& output);

// Rough size estimate, about four characters per token.
std::int32_t EstimateTokens(const std::string& text);

} // namespace forge::llm
