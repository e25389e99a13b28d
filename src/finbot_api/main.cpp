#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "finbot_api/config.hpp"
#include "finbot_api/routes.hpp"
#include "finbot_api/server.hpp"
#include "finbot_core/db/chunk_repository.hpp"
#include "finbot_core/db/database_manager.hpp"
#include "finbot_core/guardrail/guardrail_classifier.hpp"
#include "finbot_core/index/document_index.hpp"
#include "finbot_core/llm/generation_client.hpp"
#include "finbot_core/llm/http_generation_backend.hpp"
#include "finbot_core/llm/ollama_client.hpp"
#include "finbot_core/prompt/prompt_composer.hpp"
#include "finbot_core/retrieval/retriever.hpp"
#include "finbot_core/services/ingestion_service.hpp"
#include "finbot_core/services/metrics_collector.hpp"
#include "finbot_core/services/query_orchestrator.hpp"
#include "finbot_core/validation/response_validator.hpp"
#include "finbot_core/validation/sensitive_data_redactor.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {

// First argument, then FINBOT_CONFIG, then ./finbotrc.json
Config load_config(int argc, char* argv[]) {
  if (argc > 1) {
    return Config::from_file(argv[1]);
  }
  if (const char* env_path = std::getenv("FINBOT_CONFIG"); env_path != nullptr && *env_path != '\0') {
    return Config::from_file(env_path);
  }
  if (std::filesystem::exists("finbotrc.json")) {
    return Config::from_file("finbotrc.json");
  }
  std::cout << "No finbotrc.json found, using built-in defaults" << std::endl;
  return Config::from_json(nlohmann::json::object());
}

finbot_core::GuardrailConfig make_guardrail_config(const Config& config) {
  auto guardrail_config = finbot_core::GuardrailConfig::defaults();
  if (!config.jailbreak_patterns.empty()) {
    guardrail_config.jailbreak_patterns = config.jailbreak_patterns;
  }
  if (!config.jailbreak_exemplars.empty()) {
    guardrail_config.jailbreak_exemplars = config.jailbreak_exemplars;
  }
  if (!config.domain_keywords.empty()) {
    guardrail_config.domain_keywords = config.domain_keywords;
  }
  guardrail_config.jailbreak_similarity_threshold =
      static_cast<float>(config.jailbreak_similarity_threshold);
  guardrail_config.domain_similarity_threshold =
      static_cast<float>(config.domain_similarity_threshold);
  return guardrail_config;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    Config config = load_config(argc, argv);

    std::cout << "Starting Finbot API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Knowledge DB Path: " << config.knowledge_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dims)" << std::endl;
    std::cout << "Generation: " << config.llm_service << " / " << config.generation_model
              << " at " << config.generation_endpoint << std::endl;

    // --- 1. KNOWLEDGE BASE ---
    auto embedding_provider = std::make_shared<finbot_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.embedding_timeout_seconds);
    if (!embedding_provider->is_server_available()) {
      std::cerr << "Warning: Ollama server is not reachable at " << config.ollama_url << std::endl;
    }

    auto& db_manager = finbot_core::DatabaseManager::get_instance();
    db_manager.initialize(config.knowledge_db_path, /*pool_size*/ config.num_workers);
    auto chunk_repository = std::make_shared<finbot_core::ChunkRepository>(db_manager);

    auto document_index =
        std::make_shared<finbot_core::DocumentIndex>(config.embedding_dimension, embedding_provider);
    auto redactor = std::make_shared<finbot_core::SensitiveDataRedactor>();
    auto ingestion_service = std::make_shared<finbot_core::IngestionService>(
        document_index, embedding_provider, chunk_repository, redactor);

    size_t restored = ingestion_service->restore_from_repository();
    if (restored == 0 && !config.knowledge_dir.empty()) {
      std::cout << "Knowledge base is empty, ingesting " << config.knowledge_dir << std::endl;
      ingestion_service->bootstrap_from_directory(config.knowledge_dir);
    }
    std::cout << "Document index holds " << document_index->size() << " chunks" << std::endl;

    // --- 2. QUERY PIPELINE ---
    auto metrics_collector = std::make_shared<finbot_core::MetricsCollector>();
    auto guardrail = std::make_shared<finbot_core::GuardrailClassifier>(
        make_guardrail_config(config), embedding_provider, document_index);
    auto retriever = std::make_shared<finbot_core::Retriever>(document_index);
    auto composer = std::make_shared<finbot_core::PromptComposer>(config.max_prompt_chars);

    finbot_core::HttpGenerationOptions generation_options;
    generation_options.service = finbot_core::generation_service_from_string(config.llm_service);
    generation_options.endpoint = config.generation_endpoint;
    generation_options.model = config.generation_model;
    generation_options.api_token = config.hf_token;
    generation_options.temperature = config.temperature;
    generation_options.max_new_tokens = config.max_new_tokens;
    auto generation_backend =
        std::make_shared<finbot_core::HttpGenerationBackend>(generation_options);

    finbot_core::RetryPolicy retry_policy;
    retry_policy.max_retries = config.generation_max_retries;
    retry_policy.initial_backoff = std::chrono::milliseconds(config.generation_initial_backoff_ms);
    retry_policy.max_backoff = std::chrono::milliseconds(config.generation_max_backoff_ms);
    retry_policy.call_timeout = std::chrono::milliseconds(config.generation_timeout_ms);
    auto generation_client =
        std::make_shared<finbot_core::GenerationClient>(generation_backend, retry_policy);

    finbot_core::OrchestratorOptions orchestrator_options;
    orchestrator_options.top_k = static_cast<size_t>(config.retrieval_top_k);
    orchestrator_options.min_similarity = static_cast<float>(config.retrieval_min_similarity);
    orchestrator_options.answer_without_context = config.answer_without_context;
    orchestrator_options.request_deadline = std::chrono::milliseconds(config.request_deadline_ms);
    orchestrator_options.generation_timeout = std::chrono::milliseconds(config.generation_timeout_ms);
    orchestrator_options.system_instructions =
        finbot_core::PromptComposer::default_system_instructions();

    auto validator = std::make_shared<finbot_core::ResponseValidator>(
        std::vector<std::string>{orchestrator_options.system_instructions},
        std::vector<std::string>{"I don't have enough information", "contact our customer service"}, redactor);

    auto orchestrator = std::make_shared<finbot_core::QueryOrchestrator>(
        embedding_provider, guardrail, retriever, composer, generation_client, validator,
        metrics_collector, orchestrator_options);

    // --- 3. HTTP SERVER ---
    finbot_api::Server server(config.host(), config.port(), config.num_workers);
    finbot_api::Routes routes(orchestrator, ingestion_service, metrics_collector, document_index,
                              config.upload_dir, config.max_upload_bytes);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 4. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 5. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    metrics_collector->print_session_stats();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
