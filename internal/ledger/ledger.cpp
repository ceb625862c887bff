#include "ledger.hpp"

#include <cstdio>

namespace forge::ledger {

std::string HashPrompt(const std::string& prompt) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : prompt) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }

  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
  return buffer;
}

} // namespace forge::ledger
