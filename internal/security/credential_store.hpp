#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace forge::security {

/*
  Looks up the API secret for a provider. nullopt means "not configured".
*/
class CredentialStore {
 public:
  virtual ~CredentialStore() = default;

  virtual std::optional<std::string> Get(const std::string& provider) = 0;
};

/*
  Reads FORGE_<PROVIDER>_API_KEY, provider upper-cased with non-alphanumerics
  mapped to '_' (OpenAI -> FORGE_OPENAI_API_KEY). Empty values count as unset.
*/
class EnvCredentialStore final : public CredentialStore {
 public:
  std::optional<std::string> Get(const std::string& provider) override;

  static std::string VariableFor(std::string_view provider);
};

class MemoryCredentialStore final : public CredentialStore {
 public:
  std::optional<std::string> Get(const std::string& provider) override;

  void Set(const std::string& provider, const std::string& secret);
  void Remove(const std::string& provider);

 private:
  std::mutex                                   mutex_;
  std::unordered_map<std::string, std::string> secrets_;
};

} // namespace forge::security
