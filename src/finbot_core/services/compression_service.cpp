#include "finbot_core/services/compression_service.hpp"

#include <zstd.h>

namespace finbot_core {

std::vector<char> CompressionService::compress(std::string_view text, int compression_level) {
  if (text.empty()) {
    return {};
  }

  std::vector<char> buffer(ZSTD_compressBound(text.size()));
  size_t const written =
      ZSTD_compress(buffer.data(), buffer.size(), text.data(), text.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk content is not a sized zstd frame");
  }

  std::string text(content_size, '\0');
  size_t const actual = ZSTD_decompress(text.data(), text.size(), compressed_data.data(),
                                        compressed_data.size());
  if (ZSTD_isError(actual)) {
    throw CompressionError("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(actual)));
  }
  if (actual != content_size) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual) +
                           " bytes, expected " + std::to_string(content_size));
  }
  return text;
}

}  // namespace finbot_core
