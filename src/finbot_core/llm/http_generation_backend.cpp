#include "finbot_core/llm/http_generation_backend.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace finbot_core {
namespace {

class CurlGlobal {
 public:
  CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlGlobal() {
    curl_global_cleanup();
  }
};

void ensure_curl_global() {
  static CurlGlobal global;
}

std::string preview(const std::string &body) {
  return body.size() > 512 ? body.substr(0, 512) + "..." : body;
}

}  // namespace

std::string to_string(GenerationService service) {
  switch (service) {
    case GenerationService::Ollama:
      return "ollama";
    case GenerationService::HuggingFace:
      return "huggingface";
    default:
      return "unknown";
  }
}

GenerationService generation_service_from_string(const std::string &str) {
  if (str == "ollama")
    return GenerationService::Ollama;
  if (str == "huggingface")
    return GenerationService::HuggingFace;
  throw std::invalid_argument("Unsupported LLM service: " + str +
                              ". Supported services: 'ollama', 'huggingface'");
}

bool is_transient_http_status(long status) {
  return status == 408 || status == 429 || status >= 500;
}

nlohmann::json build_generation_request(const HttpGenerationOptions &options,
                                        const std::string &prompt) {
  nlohmann::json body;
  if (options.service == GenerationService::Ollama) {
    body["model"] = options.model;
    body["prompt"] = prompt;
    body["stream"] = false;
    body["options"] = {{"temperature", options.temperature},
                       {"num_predict", options.max_new_tokens}};
  } else {
    body["inputs"] = prompt;
    body["parameters"] = {{"temperature", options.temperature},
                          {"max_new_tokens", options.max_new_tokens},
                          {"repetition_penalty", 1.1},
                          {"do_sample", true},
                          {"return_full_text", false}};
  }
  return body;
}

std::string extract_generated_text(GenerationService service, const std::string &body) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    throw PermanentGenerationError("Failed to parse generation response: " + std::string(e.what()));
  }

  if (service == GenerationService::Ollama) {
    if (!json.is_object() || !json.contains("response") || !json["response"].is_string()) {
      throw PermanentGenerationError("Ollama response missing 'response' field");
    }
    return json["response"].get<std::string>();
  }

  // HuggingFace text-generation answers [{"generated_text": ...}], some endpoints
  // return the bare object
  const nlohmann::json *entry = &json;
  if (json.is_array()) {
    if (json.empty()) {
      throw PermanentGenerationError("HuggingFace response is an empty array");
    }
    entry = &json[0];
  }
  if (!entry->is_object() || !entry->contains("generated_text") ||
      !(*entry)["generated_text"].is_string()) {
    throw PermanentGenerationError("HuggingFace response missing 'generated_text' field");
  }
  return (*entry)["generated_text"].get<std::string>();
}

HttpGenerationBackend::HttpGenerationBackend(HttpGenerationOptions options)
    : options_(std::move(options)) {
  if (options_.endpoint.empty()) {
    throw std::invalid_argument("Generation endpoint must not be empty");
  }
  if (options_.service == GenerationService::HuggingFace && options_.api_token.empty()) {
    throw std::invalid_argument("HF_TOKEN is required for the HuggingFace generation service");
  }
  ensure_curl_global();
}

std::string HttpGenerationBackend::name() const {
  return to_string(options_.service) + ":" + options_.model;
}

size_t HttpGenerationBackend::write_callback(void *contents, size_t size, size_t nmemb,
                                             std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string HttpGenerationBackend::complete(const std::string &prompt,
                                            std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw TransientGenerationError("Failed to initialize CURL");
  }

  struct curl_slist *raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  if (!options_.api_token.empty()) {
    raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + options_.api_token).c_str());
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                      curl_slist_free_all);

  std::string request_body = build_generation_request(options_, prompt).dump();
  std::string response_buffer;

  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.endpoint.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw TransientGenerationError("Generation request timed out after " +
                                   std::to_string(timeout.count()) + " ms");
  }
  if (res != CURLE_OK) {
    throw TransientGenerationError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    std::string message = "Generation request failed with status code: " +
                          std::to_string(http_code) + " body: " + preview(response_buffer);
    if (is_transient_http_status(http_code)) {
      throw TransientGenerationError(message);
    }
    throw PermanentGenerationError(message);
  }

  return extract_generated_text(options_.service, response_buffer);
}

}  // namespace finbot_core
