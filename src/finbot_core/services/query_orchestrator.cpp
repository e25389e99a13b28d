#include "finbot_core/services/query_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "finbot_core/guardrail/guardrail_classifier.hpp"
#include "finbot_core/llm/embedding_provider.hpp"
#include "finbot_core/llm/generation_client.hpp"
#include "finbot_core/prompt/prompt_composer.hpp"
#include "finbot_core/retrieval/retriever.hpp"
#include "finbot_core/services/metrics_collector.hpp"
#include "finbot_core/validation/response_validator.hpp"

namespace finbot_core {
namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
  auto elapsed = std::chrono::duration<double, std::milli>(Clock::now() - since).count();
  return std::round(elapsed * 100.0) / 100.0;
}

bool is_blank(const std::string &text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::string to_string(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::Answer:
      return "answer";
    case OutcomeKind::NoContext:
      return "no_context";
    case OutcomeKind::SecurityNotice:
      return "security_notice";
    case OutcomeKind::DomainNotice:
      return "domain_notice";
    case OutcomeKind::GenerationUnavailable:
      return "generation_unavailable";
    default:
      return "unknown";
  }
}

std::string to_string(QueryStage stage) {
  switch (stage) {
    case QueryStage::Received:
      return "received";
    case QueryStage::Classified:
      return "classified";
    case QueryStage::ShortCircuited:
      return "short_circuited";
    case QueryStage::Retrieved:
      return "retrieved";
    case QueryStage::Composed:
      return "composed";
    case QueryStage::Generated:
      return "generated";
    case QueryStage::Validated:
      return "validated";
    case QueryStage::Delivered:
      return "delivered";
    default:
      return "unknown";
  }
}

nlohmann::json QueryMetrics::to_json() const {
  return {
      {"query_length", query_length},
      {"retrieved_docs", retrieved_docs},
      {"similarity_scores", similarity_scores},
      {"retrieval_time_ms", retrieval_time_ms},
      {"generation_time_ms", generation_time_ms},
      {"total_time_ms", total_time_ms},
  };
}

QueryOrchestrator::QueryOrchestrator(std::shared_ptr<EmbeddingProvider> embedding_provider,
                                     std::shared_ptr<const GuardrailClassifier> guardrail,
                                     std::shared_ptr<const Retriever> retriever,
                                     std::shared_ptr<const PromptComposer> composer,
                                     std::shared_ptr<GenerationClient> generation_client,
                                     std::shared_ptr<const ResponseValidator> validator,
                                     std::shared_ptr<MetricsCollector> metrics_collector,
                                     OrchestratorOptions options)
    : embedding_provider_(std::move(embedding_provider)),
      guardrail_(std::move(guardrail)),
      retriever_(std::move(retriever)),
      composer_(std::move(composer)),
      generation_client_(std::move(generation_client)),
      validator_(std::move(validator)),
      metrics_collector_(std::move(metrics_collector)),
      options_(std::move(options)) {
  if (!embedding_provider_ || !guardrail_ || !retriever_ || !composer_ || !generation_client_ ||
      !validator_) {
    throw std::invalid_argument("QueryOrchestrator is missing a pipeline component");
  }
  if (options_.system_instructions.empty()) {
    options_.system_instructions = PromptComposer::default_system_instructions();
  }
}

void QueryOrchestrator::record_error(const std::string &error) {
  std::cerr << "[Query] " << error << std::endl;
  if (metrics_collector_) {
    metrics_collector_->record_error(error);
  }
}

QueryOutcome QueryOrchestrator::deliver(QueryOutcome outcome, Clock::time_point start) {
  outcome.metrics.total_time_ms = elapsed_ms(start);
  outcome.stages.push_back(QueryStage::Delivered);
  std::cout << "[METRICS] " << outcome.metrics.to_json().dump() << std::endl;
  if (metrics_collector_) {
    metrics_collector_->record_query(
        std::chrono::milliseconds(static_cast<int64_t>(outcome.metrics.total_time_ms)),
        outcome.is_jailbreak, outcome.is_out_of_domain);
  }
  return outcome;
}

QueryOutcome QueryOrchestrator::process_query(const std::string &query) {
  if (is_blank(query)) {
    throw ValidationError("No query provided");
  }

  const auto start = Clock::now();
  const auto deadline = start + options_.request_deadline;

  QueryOutcome outcome;
  outcome.metrics.query_length = query.size();
  outcome.stages.push_back(QueryStage::Received);

  // Pattern rules need no embedding, so obvious jailbreaks never reach the providers
  auto verdict = guardrail_->screen_patterns(query);
  std::vector<float> query_embedding;
  if (!verdict) {
    try {
      query_embedding = embedding_provider_->get_embedding(query);
    } catch (const std::exception &e) {
      record_error("Embedding failed: " + std::string(e.what()));
      throw;
    }
    verdict = guardrail_->classify(query, query_embedding);
  }
  outcome.classification = verdict->classification;
  outcome.stages.push_back(QueryStage::Classified);

  if (verdict->is_jailbreak()) {
    std::cerr << "[Guardrail] Jailbreak attempt blocked: " << verdict->reason << std::endl;
    outcome.kind = OutcomeKind::SecurityNotice;
    outcome.response = kSecurityNotice;
    outcome.is_jailbreak = true;
    outcome.stages.push_back(QueryStage::ShortCircuited);
    return deliver(std::move(outcome), start);
  }
  if (verdict->is_out_of_domain()) {
    outcome.kind = OutcomeKind::DomainNotice;
    outcome.response = kDomainNotice;
    outcome.is_out_of_domain = true;
    outcome.stages.push_back(QueryStage::ShortCircuited);
    return deliver(std::move(outcome), start);
  }

  const auto retrieval_start = Clock::now();
  auto retrieved = retriever_->retrieve(query_embedding, options_.top_k, options_.min_similarity);
  outcome.metrics.retrieval_time_ms = elapsed_ms(retrieval_start);
  outcome.metrics.retrieved_docs = retrieved.size();
  for (const auto &hit : retrieved) {
    outcome.metrics.similarity_scores.push_back(hit.score);
  }
  outcome.stages.push_back(QueryStage::Retrieved);

  if (retrieved.empty() && !options_.answer_without_context) {
    outcome.kind = OutcomeKind::NoContext;
    outcome.response = kNoContextNotice;
    return deliver(std::move(outcome), start);
  }

  auto prompt = composer_->compose(query, retrieved, options_.system_instructions);
  for (const auto &included : prompt.included) {
    const auto &source = included.chunk->source;
    if (std::find(outcome.sources.begin(), outcome.sources.end(), source) ==
        outcome.sources.end()) {
      outcome.sources.push_back(source);
    }
  }
  outcome.stages.push_back(QueryStage::Composed);

  const auto generation_start = Clock::now();
  std::string raw_response;
  try {
    raw_response = generation_client_->generate(prompt.text, options_.generation_timeout, deadline);
  } catch (const GenerationDeadlineExceeded &e) {
    record_error("Request deadline exceeded: " + std::string(e.what()));
    throw QueryDeadlineExceeded("Query exceeded its deadline of " +
                                std::to_string(options_.request_deadline.count()) + " ms");
  } catch (const GenerationError &e) {
    record_error("Generation failed: " + std::string(e.what()));
    outcome.metrics.generation_time_ms = elapsed_ms(generation_start);
    outcome.kind = OutcomeKind::GenerationUnavailable;
    outcome.response = kApologyNotice;
    outcome.sources.clear();
    return deliver(std::move(outcome), start);
  }
  outcome.metrics.generation_time_ms = elapsed_ms(generation_start);
  outcome.stages.push_back(QueryStage::Generated);

  auto validated = validator_->validate(raw_response);
  outcome.redactions = validated.redactions;
  outcome.stages.push_back(QueryStage::Validated);
  if (validated.stripped_instructions) {
    std::cerr << "[Validator] Stripped instruction echo from generated response" << std::endl;
  }

  if (validated.text.empty()) {
    // Nothing usable survived validation, so nothing is cited either
    outcome.kind = OutcomeKind::NoContext;
    outcome.response = kNoContextNotice;
    outcome.sources.clear();
    return deliver(std::move(outcome), start);
  }
  outcome.kind = OutcomeKind::Answer;
  outcome.response = validated.text;
  return deliver(std::move(outcome), start);
}

}  // namespace finbot_core
