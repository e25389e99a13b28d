#pragma once

#include <string>
#include <vector>

#include "finbot_core/types/chunk.hpp"

namespace finbot_core {

struct ComposedPrompt {
  std::string text;
  // Chunks that made it into the context block, best first
  std::vector<ScoredChunk> included;
};

/**
 * @class PromptComposer
 * @brief Builds the generation prompt from system instructions, retrieved context and the query.
 *
 * Layout:
 *   <instructions>
 *
 *   Context:
 *   [Source: a.json]
 *   ...chunk text...
 *
 *   Question: <query>
 *
 *   Helpful Answer:
 *
 * When the prompt exceeds max_chars, chunks are dropped starting from the lowest score.
 * Instructions and query are never cut, so a prompt with no context may still exceed
 * the budget.
 */
class PromptComposer {
 public:
  explicit PromptComposer(size_t max_chars = 6000);

  ComposedPrompt compose(const std::string &query,
                         const std::vector<ScoredChunk> &retrieved,
                         const std::string &system_instructions) const;

  size_t max_chars() const {
    return max_chars_;
  }

  static const std::string &default_system_instructions();

 private:
  size_t max_chars_;

  static std::string render(const std::string &query,
                            const std::vector<ScoredChunk> &chunks,
                            const std::string &system_instructions);
};

}  // namespace finbot_core
