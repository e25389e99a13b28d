#include "finbot_core/extractors/content_extractor.hpp"
#include <utf8.h>
#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace finbot_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::vector<ExtractedDocument> ContentExtractor::extract(const fs::path& file_path) const {
  if (!can_handle(file_path)) {
    throw ContentExtractorError("Unsupported file type: " + file_path.string());
  }
  return extract_from_string(get_string_content(file_path), file_path.stem().string());
}

std::string ContentExtractor::compute_content_hash(const std::string& content) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!mdctx) {
    throw ContentExtractorError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw ContentExtractorError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw ContentExtractorError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw ContentExtractorError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string ContentExtractor::normalize_text(const std::string& text) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::string out;
  std::string line;
  bool pending_space = false;
  auto flush_line = [&]() {
    if (!line.empty()) {
      if (!out.empty()) {
        out.push_back('\n');
      }
      out += line;
    }
    line.clear();
    pending_space = false;
  };

  for (char c : valid) {
    if (c == '\n') {
      flush_line();
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      pending_space = !line.empty();
    } else {
      if (pending_space) {
        line.push_back(' ');
        pending_space = false;
      }
      line.push_back(c);
    }
  }
  flush_line();
  return out;
}

std::string ContentExtractor::format_question_answer(const std::string& question,
                                                     const std::string& answer) {
  return "Question: " + question + "\nAnswer: " + answer;
}

std::string ContentExtractor::lower_extension(const fs::path& file_path) {
  std::string extension = file_path.extension().string();
  for (auto& c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return extension;
}

std::vector<std::string> ContentExtractor::split_into_fixed_chunks(const std::string& text) const {
  std::vector<std::string> out;
  if (text.empty())
    return out;

  auto chunk_start = text.begin();
  while (chunk_start != text.end()) {
    auto it = chunk_start;
    while (it != text.end() && static_cast<size_t>(it - chunk_start) < MAX_CHUNK_SIZE) {
      auto next = it;
      utf8::next(next, text.end());
      // Stop before a sequence that would push the window past the limit
      if (static_cast<size_t>(next - chunk_start) > MAX_CHUNK_SIZE) {
        break;
      }
      it = next;
    }
    out.emplace_back(chunk_start, it);
    if (it == text.end()) {
      break;
    }

    // Step back to start the next window OVERLAP_SIZE bytes early, on a code point boundary
    auto next_start = it;
    while (next_start != chunk_start && static_cast<size_t>(it - next_start) < OVERLAP_SIZE) {
      utf8::prior(next_start, chunk_start);
    }
    chunk_start = next_start == chunk_start ? it : next_start;
  }
  return out;
}

}  // namespace finbot_core
