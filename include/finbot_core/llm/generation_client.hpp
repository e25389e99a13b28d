#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "finbot_core/llm/generation_backend.hpp"

namespace finbot_core {

struct RetryPolicy {
  int max_retries = 2;
  std::chrono::milliseconds initial_backoff{500};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{4000};
  std::chrono::milliseconds call_timeout{30000};
};

/**
 * @class GenerationClient
 * @brief Runs a prompt through a GenerationBackend with retry, backoff and deadline handling.
 *
 * Transient failures are retried up to max_retries times. A permanent failure surfaces
 * immediately as GenerationRejected, exhausted retries as GenerationUnavailable.
 */
class GenerationClient {
 public:
  using Clock = std::chrono::steady_clock;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  GenerationClient(std::shared_ptr<GenerationBackend> backend,
                   RetryPolicy policy = {},
                   SleepFn sleep_fn = nullptr);

  std::string generate(const std::string &prompt);

  // Each attempt runs with min(timeout, time left until deadline).
  // @throws GenerationDeadlineExceeded once the deadline has passed
  std::string generate(const std::string &prompt,
                       std::chrono::milliseconds timeout,
                       std::optional<Clock::time_point> deadline);

  const RetryPolicy &policy() const {
    return policy_;
  }

  std::chrono::milliseconds backoff_for_attempt(int attempt) const;

 private:
  std::shared_ptr<GenerationBackend> backend_;
  RetryPolicy policy_;
  SleepFn sleep_fn_;
};

}  // namespace finbot_core
