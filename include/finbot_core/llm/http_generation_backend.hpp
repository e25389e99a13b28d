#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "finbot_core/llm/generation_backend.hpp"

namespace finbot_core {

enum class GenerationService { Ollama, HuggingFace };

std::string to_string(GenerationService service);
GenerationService generation_service_from_string(const std::string &str);

struct HttpGenerationOptions {
  GenerationService service = GenerationService::Ollama;
  // Full URL: <ollama>/api/generate or a HuggingFace inference endpoint
  std::string endpoint;
  std::string model;
  // Sent as a bearer token when non-empty
  std::string api_token;
  double temperature = 0.1;
  int max_new_tokens = 512;
};

// 408, 429 and 5xx are worth retrying; everything else is final
bool is_transient_http_status(long status);

nlohmann::json build_generation_request(const HttpGenerationOptions &options,
                                        const std::string &prompt);

// @throws PermanentGenerationError when the body has no generated text
std::string extract_generated_text(GenerationService service, const std::string &body);

class HttpGenerationBackend : public GenerationBackend {
 public:
  explicit HttpGenerationBackend(HttpGenerationOptions options);

  std::string complete(const std::string &prompt, std::chrono::milliseconds timeout) override;

  std::string name() const override;

 private:
  HttpGenerationOptions options_;

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace finbot_core
