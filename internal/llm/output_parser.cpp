#include "output_parser.hpp"

#include <cstdint>
#include <limits>
#include <regex>

namespace forge::llm {

std::string CleanOutput(const std::string& output) {
  static const std::regex kAnsi("\x1b\\[[0-9;]*m");
  return std::regex_replace(output, kAnsi, "");
}

std::optional<std::string> ExtractJson(const std::string& output) {
  const auto end = output.rfind('}');
  if (end == std::string::npos) return std::nullopt;

  int balance = 0;
  for (std::size_t i = end + 1; i-- > 0;) {
    if (output[i] == '}') {
      ++balance;
    } else if (output[i] == '{') {
      --balance;
    }

    if (balance == 0) {
      return output.substr(i, end - i + 1);
    }
  }

  return std::nullopt;
}

namespace {

// Counts beyond int32 saturate instead of wrapping.
std::int32_t ParseCount(const std::string& digits) {
  std::int64_t value = 0;
  for (char c : digits) {
    value = value * 10 + (c - '0');
    if (value > std::numeric_limits<std::int32_t>::max()) return std::numeric_limits<std::int32_t>::max();
  }
  return static_cast<std::int32_t>(value);
}

} // namespace

std::pair<std::int32_t, std::int32_t> ExtractTokenCount(const std::string& output) {
  static const std::regex kInput("input tokens:\\s*(\\d+)", std::regex::icase);
  static const std::regex kOutput("output tokens:\\s*(\\d+)", std::regex::icase);

  std::int32_t input = 0;
  std::int32_t out   = 0;

  std::smatch match;
  if (std::regex_search(output, match, kInput)) {
    input = ParseCount(match[1].str());
  }
  if (std::regex_search(output, match, kOutput)) {
    out = ParseCount(match[1].str());
  }

  return {input, out};
}

std::int32_t EstimateTokens(const std::string& text) {
  if (text.empty()) return 0;
  return static_cast<std::int32_t>((text.size() + 3) / 4);
}

} // namespace forge::llm
