#pragma once

#include <regex>
#include <string>
#include <vector>

namespace finbot_core {

struct RedactionResult {
  std::string text;
  size_t redactions = 0;
};

// Replaces account-number-shaped identifiers: IBANs, 16 digit card numbers (plain or
// grouped by spaces/dashes) and runs of 10-17 digits. Phone numbers written in groups
// are left alone.
class SensitiveDataRedactor {
 public:
  static constexpr const char *kPlaceholder = "[REDACTED_ACCOUNT_NUMBER]";

  SensitiveDataRedactor();

  RedactionResult redact(const std::string &text) const;

 private:
  std::vector<std::regex> patterns_;
};

}  // namespace finbot_core
