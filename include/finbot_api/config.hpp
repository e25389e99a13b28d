#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Config {
 public:
  // Server and storage
  std::string api_base_url;
  std::string knowledge_db_path;
  std::string knowledge_dir;
  std::string upload_dir;
  int num_workers;
  size_t max_upload_bytes;

  // Embedding
  std::string ollama_url;
  std::string embedding_model;
  size_t embedding_dimension;
  int embedding_timeout_seconds;

  // Generation
  std::string llm_service;
  std::string generation_model;
  std::string generation_endpoint;
  std::string hf_token;
  double temperature;
  int max_new_tokens;
  int generation_timeout_ms;
  int generation_max_retries;
  int generation_initial_backoff_ms;
  int generation_max_backoff_ms;

  // Pipeline
  int request_deadline_ms;
  int retrieval_top_k;
  double retrieval_min_similarity;
  double domain_similarity_threshold;
  double jailbreak_similarity_threshold;
  size_t max_prompt_chars;
  bool answer_without_context;

  // Guardrail overrides; empty means built-in defaults
  std::vector<std::string> jailbreak_patterns;
  std::vector<std::string> jailbreak_exemplars;
  std::vector<std::string> domain_keywords;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:5014"));
      config.knowledge_db_path = json_config.value("knowledge_db_path", std::string("./data/knowledge.db"));
      config.knowledge_dir = json_config.value("knowledge_dir", std::string("./data/knowledge"));
      config.upload_dir = json_config.value("upload_dir", std::string("./data/uploads"));
      config.num_workers = json_config.value("num_workers", 4);
      config.max_upload_bytes = json_config.value("max_upload_bytes", size_t{16 * 1024 * 1024});

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_dimension = json_config.value("embedding_dimension", size_t{1024});
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 30);

      config.llm_service = json_config.value("llm_service", std::string("ollama"));
      config.generation_model =
          json_config.value("generation_model", std::string("mistralai/Mistral-7B-Instruct-v0.3"));
      config.generation_endpoint = json_config.value("generation_endpoint", std::string());
      config.hf_token = json_config.value("hf_token", std::string());
      config.temperature = json_config.value("temperature", 0.1);
      config.max_new_tokens = json_config.value("max_new_tokens", 512);
      config.generation_timeout_ms = json_config.value("generation_timeout_ms", 30000);
      config.generation_max_retries = json_config.value("generation_max_retries", 2);
      config.generation_initial_backoff_ms = json_config.value("generation_initial_backoff_ms", 500);
      config.generation_max_backoff_ms = json_config.value("generation_max_backoff_ms", 4000);

      config.request_deadline_ms = json_config.value("request_deadline_ms", 60000);
      config.retrieval_top_k = json_config.value("retrieval_top_k", 3);
      config.retrieval_min_similarity = json_config.value("retrieval_min_similarity", 0.3);
      config.domain_similarity_threshold = json_config.value("domain_similarity_threshold", 0.35);
      config.jailbreak_similarity_threshold = json_config.value("jailbreak_similarity_threshold", 0.85);
      config.max_prompt_chars = json_config.value("max_prompt_chars", size_t{6000});
      config.answer_without_context = json_config.value("answer_without_context", false);

      config.jailbreak_patterns = json_config.value("jailbreak_patterns", std::vector<std::string>{});
      config.jailbreak_exemplars = json_config.value("jailbreak_exemplars", std::vector<std::string>{});
      config.domain_keywords = json_config.value("domain_keywords", std::vector<std::string>{});
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    // The token is a secret, so the environment wins over the file
    if (const char* env_token = std::getenv("HF_TOKEN"); env_token != nullptr && *env_token != '\0') {
      config.hf_token = env_token;
    }
    if (config.generation_endpoint.empty()) {
      config.generation_endpoint = config.default_generation_endpoint();
    }

    config.validate();
    return config;
  }

  // Host part of api_base_url ("host:port")
  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  std::string default_generation_endpoint() const {
    if (llm_service == "huggingface") {
      return "https://api-inference.huggingface.co/models/" + generation_model;
    }
    return ollama_url + "/api/generate";
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (knowledge_db_path.empty()) {
      throw std::runtime_error("knowledge_db_path cannot be empty");
    }
    if (upload_dir.empty()) {
      throw std::runtime_error("upload_dir cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (max_upload_bytes == 0) {
      throw std::runtime_error("max_upload_bytes must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension == 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (llm_service != "ollama" && llm_service != "huggingface") {
      throw std::runtime_error("llm_service must be 'ollama' or 'huggingface'");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (llm_service == "huggingface" && hf_token.empty()) {
      throw std::runtime_error("hf_token (or HF_TOKEN) is required for the huggingface service");
    }
    if (temperature < 0.0 || temperature > 2.0) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
    if (max_new_tokens <= 0) {
      throw std::runtime_error("max_new_tokens must be greater than 0");
    }
    if (generation_timeout_ms <= 0) {
      throw std::runtime_error("generation_timeout_ms must be greater than 0");
    }
    if (generation_max_retries < 0) {
      throw std::runtime_error("generation_max_retries cannot be negative");
    }
    if (generation_initial_backoff_ms < 0 || generation_max_backoff_ms < generation_initial_backoff_ms) {
      throw std::runtime_error("generation backoff must satisfy 0 <= initial <= max");
    }
    if (request_deadline_ms <= 0) {
      throw std::runtime_error("request_deadline_ms must be greater than 0");
    }
    if (retrieval_top_k <= 0) {
      throw std::runtime_error("retrieval_top_k must be greater than 0");
    }
    for (double threshold : {retrieval_min_similarity, domain_similarity_threshold, jailbreak_similarity_threshold}) {
      if (threshold < -1.0 || threshold > 1.0) {
        throw std::runtime_error("similarity thresholds must be between -1 and 1");
      }
    }
    if (max_prompt_chars == 0) {
      throw std::runtime_error("max_prompt_chars must be greater than 0");
    }
  }
};
