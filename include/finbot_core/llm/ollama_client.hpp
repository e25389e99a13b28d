#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "finbot_core/llm/embedding_provider.hpp"

// ollama-hpp
class Ollama;

namespace finbot_core {

class OllamaError : public EmbeddingError {
 public:
  explicit OllamaError(const std::string &message) : EmbeddingError(message) {}
};

class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               int read_timeout_seconds = 30);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::unique_ptr<Ollama> ollama_;
  // The underlying http client is not safe for concurrent requests
  std::mutex request_mutex_;

  void setup_server_connection(int read_timeout_seconds);
};

}  // namespace finbot_core
