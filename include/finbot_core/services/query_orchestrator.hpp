#pragma once

#include <exception>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "finbot_core/types/classification.hpp"

namespace finbot_core {

class EmbeddingProvider;
class GuardrailClassifier;
class Retriever;
class PromptComposer;
class GenerationClient;
class ResponseValidator;
class MetricsCollector;

// Malformed input; never retried
class ValidationError : public std::exception {
 public:
  explicit ValidationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class QueryDeadlineExceeded : public std::exception {
 public:
  explicit QueryDeadlineExceeded(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class OutcomeKind { Answer, NoContext, SecurityNotice, DomainNotice, GenerationUnavailable };

enum class QueryStage {
  Received,
  Classified,
  ShortCircuited,
  Retrieved,
  Composed,
  Generated,
  Validated,
  Delivered
};

std::string to_string(OutcomeKind kind);
std::string to_string(QueryStage stage);

struct QueryMetrics {
  size_t query_length = 0;
  size_t retrieved_docs = 0;
  std::vector<float> similarity_scores;
  double retrieval_time_ms = 0.0;
  double generation_time_ms = 0.0;
  double total_time_ms = 0.0;

  nlohmann::json to_json() const;
};

struct QueryOutcome {
  OutcomeKind kind = OutcomeKind::Answer;
  std::string response;
  // Unique, in rank order, only chunks that were part of the prompt
  std::vector<std::string> sources;
  bool is_jailbreak = false;
  bool is_out_of_domain = false;
  Classification classification = Classification::InDomain;
  size_t redactions = 0;
  QueryMetrics metrics;
  std::vector<QueryStage> stages;
};

struct OrchestratorOptions {
  size_t top_k = 3;
  float min_similarity = 0.3f;
  // When false an in-domain query with no retrieved context gets the fixed notice
  bool answer_without_context = false;
  std::chrono::milliseconds request_deadline{60000};
  std::chrono::milliseconds generation_timeout{30000};
  std::string system_instructions;
};

/**
 * @class QueryOrchestrator
 * @brief Runs one query through classify -> retrieve -> compose -> generate -> validate.
 *
 * Guardrail flags and generation failures come back as tagged outcomes. Only an empty
 * query (ValidationError), an exceeded request deadline (QueryDeadlineExceeded) and
 * embedding failures are thrown. Queries never mutate the document index.
 */
class QueryOrchestrator {
 public:
  static constexpr const char *kSecurityNotice =
      "I cannot process this request as it appears to be attempting to bypass my operational "
      "guidelines. Please submit a valid banking inquiry.";
  static constexpr const char *kDomainNotice =
      "I'm a Finbot assistant, designed to help with banking-related inquiries. It seems your "
      "question is not related to Finbot services. I'd be happy to help with questions about "
      "accounts, transfers, loans, credit cards, or other banking products and services.";
  static constexpr const char *kNoContextNotice =
      "I don't have enough information to answer this question. Please contact our customer "
      "service at +92 (51) 111 000 494 for assistance.";
  static constexpr const char *kApologyNotice =
      "I'm sorry, I'm unable to generate a response right now. Please try again later or "
      "contact our customer service at +92 (51) 111 000 494 for assistance.";

  QueryOrchestrator(std::shared_ptr<EmbeddingProvider> embedding_provider,
                    std::shared_ptr<const GuardrailClassifier> guardrail,
                    std::shared_ptr<const Retriever> retriever,
                    std::shared_ptr<const PromptComposer> composer,
                    std::shared_ptr<GenerationClient> generation_client,
                    std::shared_ptr<const ResponseValidator> validator,
                    std::shared_ptr<MetricsCollector> metrics_collector,
                    OrchestratorOptions options);

  QueryOutcome process_query(const std::string &query);

  const OrchestratorOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<const GuardrailClassifier> guardrail_;
  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<const PromptComposer> composer_;
  std::shared_ptr<GenerationClient> generation_client_;
  std::shared_ptr<const ResponseValidator> validator_;
  std::shared_ptr<MetricsCollector> metrics_collector_;
  OrchestratorOptions options_;

  QueryOutcome deliver(QueryOutcome outcome, std::chrono::steady_clock::time_point start);
  void record_error(const std::string &error);
};

}  // namespace finbot_core
