#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "finbot_core/types/classification.hpp"

namespace finbot_core {

class DocumentIndex;
class EmbeddingProvider;

struct GuardrailConfig {
  // Case-insensitive ECMAScript regular expressions
  std::vector<std::string> jailbreak_patterns;
  std::vector<std::string> jailbreak_exemplars;
  // Used only while the index is empty
  std::vector<std::string> domain_keywords;
  float jailbreak_similarity_threshold = 0.85f;
  float domain_similarity_threshold = 0.35f;

  static std::vector<std::string> default_jailbreak_patterns();
  static std::vector<std::string> default_jailbreak_exemplars();
  static std::vector<std::string> default_domain_keywords();
  static GuardrailConfig defaults();
};

struct GuardrailVerdict {
  Classification classification = Classification::InDomain;
  // Pattern hits score 1; otherwise the similarity that decided the verdict
  float score = 0.0f;
  std::string reason;

  bool is_jailbreak() const {
    return classification == Classification::Jailbreak;
  }
  bool is_out_of_domain() const {
    return classification == Classification::OutOfDomain;
  }
};

/**
 * @class GuardrailClassifier
 * @brief Labels a query as in-domain, out-of-domain or a jailbreak attempt.
 *
 * Jailbreak detection runs first and is terminal: a pattern hit or an exemplar similarity
 * at or above the jailbreak threshold. Otherwise the best similarity against the
 * document index decides the domain; with an empty index the keyword lexicon does.
 * Classification has no side effects.
 */
class GuardrailClassifier {
 public:
  GuardrailClassifier(GuardrailConfig config,
                      std::shared_ptr<EmbeddingProvider> embedding_provider,
                      std::shared_ptr<const DocumentIndex> document_index);

  GuardrailVerdict classify(const std::string &text) const;
  GuardrailVerdict classify(const std::string &text, const std::vector<float> &embedding) const;

  // Lexical stage only, usable before the query is embedded
  std::optional<GuardrailVerdict> screen_patterns(const std::string &text) const;

  bool mentions_domain_keyword(const std::string &text) const;

  const GuardrailConfig &config() const {
    return config_;
  }

 private:
  GuardrailConfig config_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<const DocumentIndex> document_index_;
  std::vector<std::regex> compiled_patterns_;
  std::vector<std::vector<float>> exemplar_embeddings_;
  std::vector<std::string> lowered_keywords_;

  GuardrailVerdict classify_domain(const std::string &text,
                                   const std::vector<float> &embedding) const;
};

}  // namespace finbot_core
