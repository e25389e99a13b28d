#include "finbot_core/prompt/prompt_composer.hpp"

#include <algorithm>
#include <sstream>

namespace finbot_core {

PromptComposer::PromptComposer(size_t max_chars) : max_chars_(max_chars) {}

const std::string &PromptComposer::default_system_instructions() {
  static const std::string instructions =
      "You are an AI assistant for Finbot, a trusted financial institution. Your role is to "
      "provide helpful, accurate, and professional responses to customer inquiries about the "
      "bank's products, services, and procedures.\n"
      "Use the following pieces of bank information to answer the question at the end.\n"
      "If you don't know the answer, just say \"I don't have enough information to answer this "
      "question. Please contact our customer service at +92 (51) 111 000 494 for "
      "assistance.\" Don't try to make up an answer.";
  return instructions;
}

std::string PromptComposer::render(const std::string &query,
                                   const std::vector<ScoredChunk> &chunks,
                                   const std::string &system_instructions) {
  std::stringstream ss;
  ss << system_instructions << "\n\n";
  if (!chunks.empty()) {
    ss << "Context:\n";
    for (size_t i = 0; i < chunks.size(); ++i) {
      if (i > 0) {
        ss << "\n";
      }
      ss << "[Source: " << chunks[i].chunk->source << "]\n" << chunks[i].chunk->text << "\n";
    }
    ss << "\n";
  }
  ss << "Question: " << query << "\n\nHelpful Answer:";
  return ss.str();
}

ComposedPrompt PromptComposer::compose(const std::string &query,
                                       const std::vector<ScoredChunk> &retrieved,
                                       const std::string &system_instructions) const {
  std::vector<ScoredChunk> included = retrieved;
  std::stable_sort(included.begin(), included.end(),
                   [](const ScoredChunk &a, const ScoredChunk &b) { return a.score > b.score; });

  std::string text = render(query, included, system_instructions);
  while (text.size() > max_chars_ && !included.empty()) {
    included.pop_back();
    text = render(query, included, system_instructions);
  }
  return ComposedPrompt{std::move(text), std::move(included)};
}

}  // namespace finbot_core
