#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace finbot_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// One knowledge base entry pulled out of an uploaded file, before embedding
struct ExtractedDocument {
  std::string text;
  std::string category;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads the file and hands its content to extract_from_string. The file stem is the
  // category for entries that do not name one.
  virtual std::vector<ExtractedDocument> extract(const fs::path& file_path) const;

  virtual std::vector<ExtractedDocument> extract_from_string(
      const std::string& content, const std::string& default_category) const = 0;

  // Hex SHA-256 of the given text
  static std::string compute_content_hash(const std::string& content);

  // Replaces invalid UTF-8, collapses runs of blanks, trims lines and drops empty ones
  static std::string normalize_text(const std::string& text);

  // "Question: <q>\nAnswer: <a>"
  static std::string format_question_answer(const std::string& question, const std::string& answer);

  // ".JSON" -> ".json"
  static std::string lower_extension(const fs::path& file_path);

 protected:
  std::string get_string_content(const fs::path& file_path) const;

  static constexpr size_t MAX_CHUNK_SIZE = 1000;
  static constexpr size_t MIN_CHUNK_SIZE = 100;
  static constexpr size_t OVERLAP_SIZE = 50;

  // Fixed-size windows of at most MAX_CHUNK_SIZE bytes that overlap by about
  // OVERLAP_SIZE bytes and never split a UTF-8 sequence. Input must be valid UTF-8.
  std::vector<std::string> split_into_fixed_chunks(const std::string& text) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace finbot_core
