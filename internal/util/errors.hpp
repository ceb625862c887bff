#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace forge::util {

/*
  Central error types.

  Run-aborting errors (NotFound, ParseError, MissingCredential,
  UnsupportedProvider, GenerationError) propagate out of the engine.
  LedgerWriteError and SignalDeliveryError are logged and swallowed by it.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingCredential : public std::runtime_error {
 public:
  explicit MissingCredential(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedProvider : public std::runtime_error {
 public:
  explicit UnsupportedProvider(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct TokenUsage {
  std::int32_t input_tokens  = 0;
  std::int32_t output_tokens = 0;
  double       cost          = 0.0;
};

// Carries whatever usage the provider reported before failing, so billing can
// still account for it.
class GenerationError : public std::runtime_error {
 public:
  explicit GenerationError(const std::string& msg, TokenUsage partial = {}) : std::runtime_error(msg), partial_(partial) {
  }

  const TokenUsage& partial_usage() const {
    return partial_;
  }

 private:
  TokenUsage partial_;
};

class LedgerWriteError : public std::runtime_error {
 public:
  explicit LedgerWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SignalDeliveryError : public std::runtime_error {
 public:
  explicit SignalDeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyRunning : public std::runtime_error {
 public:
  explicit AlreadyRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace forge::util
