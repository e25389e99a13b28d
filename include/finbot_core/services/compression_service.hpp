#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace finbot_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Chunk text is stored zstd-compressed in the knowledge database
class CompressionService {
 public:
  static constexpr int kDefaultLevel = 3;

  /**
   * @brief Compresses chunk text into a single zstd frame.
   * @return Empty for empty input.
   * @throws CompressionError
   */
  static std::vector<char> compress(std::string_view text, int compression_level = kDefaultLevel);

  /**
   * @brief Inverse of compress(). The frame must record its content size.
   * @throws CompressionError on data that is not a zstd frame
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace finbot_core
