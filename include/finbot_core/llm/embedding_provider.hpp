#pragma once

#include <exception>
#include <string>
#include <vector>

namespace finbot_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Maps text to a fixed-dimension vector. Implementations must be safe to call from
// several request threads at once.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto &text : texts) {
      embeddings.push_back(get_embedding(text));
    }
    return embeddings;
  }
};

}  // namespace finbot_core
