#include "credential_store.hpp"

#include <cctype>
#include <cstdlib>

namespace forge::security {

std::string EnvCredentialStore::VariableFor(std::string_view provider) {
  std::string name = "FORGE_";
  for (unsigned char c : provider) {
    name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
  }
  name += "_API_KEY";
  return name;
}

std::optional<std::string> EnvCredentialStore::Get(const std::string& provider) {
  const char* value = std::getenv(VariableFor(provider).c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<std::string> MemoryCredentialStore::Get(const std::string& provider) {
  std::lock_guard lock(mutex_);
  auto            it = secrets_.find(provider);
  if (it == secrets_.end()) return std::nullopt;
  return it->second;
}

void MemoryCredentialStore::Set(const std::string& provider, const std::string& secret) {
  std::lock_guard lock(mutex_);
  secrets_[provider] = secret;
}

void MemoryCredentialStore::Remove(const std::string& provider) {
  std::lock_guard lock(mutex_);
  secrets_.erase(provider);
}

} // namespace forge::security
