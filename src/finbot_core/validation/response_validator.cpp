#include "finbot_core/validation/response_validator.hpp"

#include <algorithm>
#include <cctype>

namespace finbot_core {
namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string trim(const std::string &text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

// Splits after '.', '!' or '?' followed by whitespace, and at newlines. Each piece keeps
// its trailing whitespace so that joining the pieces reproduces the input.
std::vector<std::string> split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    current.push_back(c);
    bool terminal = (c == '.' || c == '!' || c == '?') &&
                    (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])));
    if (terminal || c == '\n') {
      while (i + 1 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 1]))) {
        current.push_back(text[++i]);
      }
      sentences.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    sentences.push_back(std::move(current));
  }
  return sentences;
}

}  // namespace

ResponseValidator::ResponseValidator(std::vector<std::string> instruction_texts,
                                     std::vector<std::string> allowed_phrases,
                                     std::shared_ptr<const SensitiveDataRedactor> redactor)
    : redactor_(std::move(redactor)) {
  for (auto &text : instruction_texts) {
    if (!text.empty()) {
      lowered_instructions_.push_back(to_lower(std::move(text)));
    }
  }
  for (auto &phrase : allowed_phrases) {
    if (!phrase.empty()) {
      lowered_allowed_.push_back(to_lower(std::move(phrase)));
    }
  }
  if (!redactor_) {
    redactor_ = std::make_shared<SensitiveDataRedactor>();
  }
}

bool ResponseValidator::echoes_instructions(const std::string &sentence) const {
  std::string lowered = to_lower(trim(sentence));
  if (lowered.size() < kMinEchoChars) {
    return false;
  }
  for (const auto &allowed : lowered_allowed_) {
    if (lowered.find(allowed) != std::string::npos) {
      return false;
    }
  }
  for (const auto &instructions : lowered_instructions_) {
    if (instructions.find(lowered) != std::string::npos) {
      return true;
    }
  }
  return false;
}

ValidationResult ResponseValidator::validate(const std::string &raw_response) const {
  ValidationResult result;

  std::string kept;
  for (const auto &sentence : split_sentences(raw_response)) {
    if (echoes_instructions(sentence)) {
      result.stripped_instructions = true;
      continue;
    }
    kept += sentence;
  }

  // Only the seams left by removed sentences are trimmed; an untouched answer keeps its layout
  std::string body = result.stripped_instructions ? trim(kept) : std::move(kept);
  if (trim(body).empty()) {
    body.clear();
  }
  auto redacted = redactor_->redact(body);
  result.text = std::move(redacted.text);
  result.redactions = redacted.redactions;
  return result;
}

}  // namespace finbot_core
