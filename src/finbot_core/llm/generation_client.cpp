#include "finbot_core/llm/generation_client.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace finbot_core {

GenerationClient::GenerationClient(std::shared_ptr<GenerationBackend> backend,
                                   RetryPolicy policy,
                                   SleepFn sleep_fn)
    : backend_(std::move(backend)), policy_(policy), sleep_fn_(std::move(sleep_fn)) {
  if (!backend_) {
    throw std::invalid_argument("GenerationClient requires a backend");
  }
  if (policy_.max_retries < 0) {
    throw std::invalid_argument("max_retries must not be negative");
  }
  if (!sleep_fn_) {
    sleep_fn_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::chrono::milliseconds GenerationClient::backoff_for_attempt(int attempt) const {
  double delay = static_cast<double>(policy_.initial_backoff.count()) *
                 std::pow(policy_.backoff_multiplier, attempt);
  double capped = std::min(delay, static_cast<double>(policy_.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

std::string GenerationClient::generate(const std::string &prompt) {
  return generate(prompt, policy_.call_timeout, std::nullopt);
}

std::string GenerationClient::generate(const std::string &prompt,
                                       std::chrono::milliseconds timeout,
                                       std::optional<Clock::time_point> deadline) {
  const int max_attempts = policy_.max_retries + 1;
  std::string last_error;

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    auto attempt_timeout = timeout;
    if (deadline) {
      // Rounded up so a backend that uses its whole budget reaches the deadline
      auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
      if (remaining.count() <= 0) {
        throw GenerationDeadlineExceeded("Request deadline passed before generation attempt " +
                                         std::to_string(attempt + 1));
      }
      attempt_timeout = std::min(attempt_timeout, remaining);
    }

    try {
      return backend_->complete(prompt, attempt_timeout);
    } catch (const PermanentGenerationError &e) {
      std::cerr << "[Generation] " << backend_->name() << " rejected the request: " << e.what()
                << std::endl;
      throw GenerationRejected(e.what());
    } catch (const TransientGenerationError &e) {
      last_error = e.what();
      std::cerr << "[Generation] attempt " << (attempt + 1) << "/" << max_attempts
                << " failed: " << last_error << std::endl;
    }

    // An attempt cut short by the deadline is a timeout, even on the last attempt
    if (deadline && Clock::now() >= *deadline) {
      throw GenerationDeadlineExceeded("Request deadline passed during generation attempt " +
                                       std::to_string(attempt + 1) + ": " + last_error);
    }

    if (attempt + 1 < max_attempts) {
      auto delay = backoff_for_attempt(attempt);
      if (deadline) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
        if (remaining <= delay) {
          throw GenerationDeadlineExceeded("Request deadline passed while waiting to retry: " +
                                           last_error);
        }
      }
      sleep_fn_(delay);
    }
  }

  throw GenerationUnavailable("Generation failed after " + std::to_string(max_attempts) +
                              " attempts: " + last_error);
}

}  // namespace finbot_core
