#pragma once
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "server.hpp"

// Forward declarations
namespace finbot_core {
class QueryOrchestrator;
class IngestionService;
class MetricsCollector;
class DocumentIndex;
}  // namespace finbot_core

namespace finbot_api {

class Routes {
 public:
  static constexpr const char *kVersion = "0.1.0";

  Routes(std::shared_ptr<finbot_core::QueryOrchestrator> orchestrator,
         std::shared_ptr<finbot_core::IngestionService> ingestion_service,
         std::shared_ptr<finbot_core::MetricsCollector> metrics_collector,
         std::shared_ptr<const finbot_core::DocumentIndex> document_index,
         std::filesystem::path upload_dir,
         size_t max_upload_bytes);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Allow move constructor and assignment
  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be driven without a listening socket
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_add_document(const crow::request &req);
  crow::response handle_stats(const crow::request &req);

  // Keeps only the final path component and replaces anything outside [A-Za-z0-9._-]
  static std::string sanitize_filename(const std::string &filename);

 private:
  std::shared_ptr<finbot_core::QueryOrchestrator> orchestrator_;
  std::shared_ptr<finbot_core::IngestionService> ingestion_service_;
  std::shared_ptr<finbot_core::MetricsCollector> metrics_collector_;
  std::shared_ptr<const finbot_core::DocumentIndex> document_index_;
  std::filesystem::path upload_dir_;
  size_t max_upload_bytes_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  void record_error(const std::string &error);
};

}  // namespace finbot_api
