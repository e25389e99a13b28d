#pragma once

#include <exception>
#include <chrono>
#include <string>

namespace finbot_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Backend level: the attempt failed but a retry may succeed (network error, timeout,
// HTTP 408/429/5xx)
class TransientGenerationError : public GenerationError {
 public:
  explicit TransientGenerationError(const std::string &message) : GenerationError(message) {}
};

// Backend level: retrying will not help (auth, malformed request, other 4xx, unparsable body)
class PermanentGenerationError : public GenerationError {
 public:
  explicit PermanentGenerationError(const std::string &message) : GenerationError(message) {}
};

// Client level outcomes
class GenerationUnavailable : public GenerationError {
 public:
  explicit GenerationUnavailable(const std::string &message) : GenerationError(message) {}
};

class GenerationRejected : public GenerationError {
 public:
  explicit GenerationRejected(const std::string &message) : GenerationError(message) {}
};

class GenerationDeadlineExceeded : public GenerationError {
 public:
  explicit GenerationDeadlineExceeded(const std::string &message) : GenerationError(message) {}
};

// One attempt against a text generation model. Implementations enforce the timeout
// themselves and report failures as TransientGenerationError or PermanentGenerationError.
class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  virtual std::string complete(const std::string &prompt, std::chrono::milliseconds timeout) = 0;

  virtual std::string name() const = 0;
};

}  // namespace finbot_core
