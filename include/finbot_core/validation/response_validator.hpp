#pragma once

#include <memory>
#include <string>
#include <vector>

#include "finbot_core/validation/sensitive_data_redactor.hpp"

namespace finbot_core {

struct ValidationResult {
  std::string text;
  size_t redactions = 0;
  bool stripped_instructions = false;
};

/**
 * @class ResponseValidator
 * @brief Post-filters generated text before it reaches the user.
 *
 * Drops sentences that repeat the system or guardrail instructions and redacts
 * account-number-shaped identifiers. Never rejects a response.
 */
class ResponseValidator {
 public:
  // Sentences shorter than this are too generic to count as an instruction echo
  static constexpr size_t kMinEchoChars = 24;

  /**
   * @param instruction_texts Texts the model must not parrot back.
   * @param allowed_phrases Sentences containing any of these are kept even when they
   *        also appear in the instructions (e.g. the scripted fallback answer).
   */
  ResponseValidator(std::vector<std::string> instruction_texts,
                    std::vector<std::string> allowed_phrases = {},
                    std::shared_ptr<const SensitiveDataRedactor> redactor = nullptr);

  ValidationResult validate(const std::string &raw_response) const;

 private:
  std::vector<std::string> lowered_instructions_;
  std::vector<std::string> lowered_allowed_;
  std::shared_ptr<const SensitiveDataRedactor> redactor_;

  bool echoes_instructions(const std::string &sentence) const;
};

}  // namespace finbot_core
