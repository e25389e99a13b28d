#pragma once

#include <string>

namespace finbot_core {

enum class Classification { InDomain, OutOfDomain, Jailbreak };

std::string to_string(Classification classification);
Classification classification_from_string(const std::string& str);

}  // namespace finbot_core
