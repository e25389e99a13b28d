#include "finbot_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace finbot_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           int read_timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      ollama_(std::make_unique<Ollama>(ollama_url)) {
  setup_server_connection(read_timeout_seconds);
}

OllamaClient::~OllamaClient() = default;

void OllamaClient::setup_server_connection(int read_timeout_seconds) {
  ollama_->setReadTimeout(read_timeout_seconds);
  ollama_->setWriteTimeout(read_timeout_seconds);
  if (!ollama_->is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
  std::cout << "Connected to Ollama at " << ollama_url_ << " (embedding model: "
            << embedding_model_ << ")" << std::endl;
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = [&] {
      std::lock_guard<std::mutex> lock(request_mutex_);
      return ollama_->generate_embeddings(embedding_model_, text);
    }();

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // /api/embed answers with an array of vectors, one per input
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw OllamaError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return ollama_->is_running();
}

}  // namespace finbot_core
