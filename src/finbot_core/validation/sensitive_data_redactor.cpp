#include "finbot_core/validation/sensitive_data_redactor.hpp"

#include <iterator>

namespace finbot_core {

SensitiveDataRedactor::SensitiveDataRedactor() {
  // Most specific first so an IBAN is not half eaten by the digit rule
  patterns_.emplace_back(R"(\b[A-Z]{2}\d{2}(?:[ ]?[A-Z0-9]{4}){3,7}(?:[ ]?[A-Z0-9]{1,4})?\b)");
  patterns_.emplace_back(R"(\b\d{4}[ -]\d{4}[ -]\d{4}[ -]\d{4}\b)");
  patterns_.emplace_back(R"(\b\d{10,17}\b)");
}

RedactionResult SensitiveDataRedactor::redact(const std::string &text) const {
  RedactionResult result{text, 0};
  for (const auto &pattern : patterns_) {
    auto begin = std::sregex_iterator(result.text.begin(), result.text.end(), pattern);
    auto matches = static_cast<size_t>(std::distance(begin, std::sregex_iterator()));
    if (matches == 0) {
      continue;
    }
    result.redactions += matches;
    result.text = std::regex_replace(result.text, pattern, kPlaceholder);
  }
  return result;
}

}  // namespace finbot_core
