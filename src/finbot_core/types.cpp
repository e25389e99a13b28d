#include "finbot_core/types.hpp"

#include <stdexcept>

namespace finbot_core {

std::string to_string(Classification classification) {
  switch (classification) {
    case Classification::InDomain:
      return "in_domain";
    case Classification::OutOfDomain:
      return "out_of_domain";
    case Classification::Jailbreak:
      return "jailbreak";
    default:
      return "unknown";
  }
}

Classification classification_from_string(const std::string& str) {
  if (str == "in_domain")
    return Classification::InDomain;
  if (str == "out_of_domain")
    return Classification::OutOfDomain;
  if (str == "jailbreak")
    return Classification::Jailbreak;
  throw std::invalid_argument("Unknown Classification: " + str);
}

}  // namespace finbot_core
