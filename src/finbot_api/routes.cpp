#include "finbot_api/routes.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "finbot_core/extractors/content_extractor.hpp"
#include "finbot_core/index/document_index.hpp"
#include "finbot_core/llm/embedding_provider.hpp"
#include "finbot_core/services/ingestion_service.hpp"
#include "finbot_core/services/metrics_collector.hpp"
#include "finbot_core/services/query_orchestrator.hpp"

namespace finbot_api {
Routes::Routes(std::shared_ptr<finbot_core::QueryOrchestrator> orchestrator,
               std::shared_ptr<finbot_core::IngestionService> ingestion_service,
               std::shared_ptr<finbot_core::MetricsCollector> metrics_collector,
               std::shared_ptr<const finbot_core::DocumentIndex> document_index,
               std::filesystem::path upload_dir,
               size_t max_upload_bytes)
    : orchestrator_(orchestrator),
      ingestion_service_(ingestion_service),
      metrics_collector_(metrics_collector),
      document_index_(document_index),
      upload_dir_(std::move(upload_dir)),
      max_upload_bytes_(max_upload_bytes) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/api/upload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload(req);
  });

  CROW_ROUTE(app, "/api/add-document")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_add_document(req); });

  CROW_ROUTE(app, "/api/stats")
  ([this](const crow::request &req) { return handle_stats(req); });
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Finbot API is running");
  response["version"] = kVersion;
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_query(const crow::request &req) {
  std::string query;
  try {
    auto json_body = parse_json_body(req.body);
    if (!json_body.is_object()) {
      return create_json_response(create_error_response("Request body must be a JSON object"), 400);
    }
    auto query_it = json_body.find("query");
    if (query_it != json_body.end() && !query_it->is_string()) {
      return create_json_response(create_error_response("Field 'query' must be a string"), 400);
    }
    query = json_body.value("query", "");
  } catch (const nlohmann::json::parse_error &e) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  }

  try {
    auto outcome = orchestrator_->process_query(query);

    nlohmann::json response;
    response["response"] = outcome.response;
    response["sources"] = outcome.sources;
    response["is_jailbreak"] = outcome.is_jailbreak;
    response["is_out_of_domain"] = outcome.is_out_of_domain;
    response["outcome"] = finbot_core::to_string(outcome.kind);
    return create_json_response(response);
  } catch (const finbot_core::ValidationError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const finbot_core::QueryDeadlineExceeded &e) {
    return create_json_response(create_error_response(e.what()), 504);
  } catch (const finbot_core::EmbeddingError &e) {
    // Already counted by the orchestrator
    return create_json_response(create_error_response(e.what()), 500);
  } catch (const std::exception &e) {
    record_error("Exception in handle_query: " + std::string(e.what()));
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_upload(const crow::request &req) {
  if (req.body.size() > max_upload_bytes_) {
    return create_json_response(
        create_error_response("File too large; the limit is " + std::to_string(max_upload_bytes_) +
                              " bytes"),
        413);
  }
  if (req.get_header_value("Content-Type").find("multipart/form-data") == std::string::npos) {
    return create_json_response(create_error_response("No file part"), 400);
  }

  try {
    crow::multipart::message message(req);
    auto file_part = message.get_part_by_name("file");
    const auto &disposition = crow::multipart::get_header_object(file_part.headers, "Content-Disposition");
    auto filename_it = disposition.params.find("filename");
    if (filename_it == disposition.params.end()) {
      return create_json_response(create_error_response("No file part"), 400);
    }
    std::string filename = sanitize_filename(filename_it->second);
    if (filename.empty()) {
      return create_json_response(create_error_response("No selected file"), 400);
    }
    std::filesystem::path target = upload_dir_ / filename;
    if (!ingestion_service_->extractor_factory().is_supported(target)) {
      return create_json_response(create_error_response("File type not allowed"), 400);
    }

    std::error_code ec;
    std::filesystem::create_directories(upload_dir_, ec);
    if (ec) {
      throw std::runtime_error("Failed to create upload directory: " + ec.message());
    }
    {
      std::ofstream out(target, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw std::runtime_error("Failed to save uploaded file: " + filename);
      }
      out.write(file_part.body.data(), static_cast<std::streamsize>(file_part.body.size()));
    }
    std::cout << "[Upload] Saved " << target << " (" << file_part.body.size() << " bytes)"
              << std::endl;

    auto result = ingestion_service_->ingest_file(target);
    return create_json_response(result.to_json(), result.success ? 200 : 400);
  } catch (const finbot_core::ContentExtractorError &e) {
    record_error("Upload rejected: " + std::string(e.what()));
    nlohmann::json response = {{"success", false}, {"message", e.what()}};
    return create_json_response(response, 400);
  } catch (const std::exception &e) {
    record_error("Exception in handle_upload: " + std::string(e.what()));
    nlohmann::json response = {{"success", false}, {"message", e.what()}};
    return create_json_response(response, 500);
  }
}

crow::response Routes::handle_add_document(const crow::request &req) {
  nlohmann::json json_body;
  try {
    json_body = parse_json_body(req.body);
  } catch (const nlohmann::json::parse_error &e) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  }

  auto text_field = [&json_body](const char *key) -> std::string {
    if (!json_body.is_object() || !json_body.contains(key) || !json_body[key].is_string()) {
      return "";
    }
    return json_body[key].get<std::string>();
  };
  std::string category = text_field("category");
  std::string question = text_field("question");
  std::string answer = text_field("answer");
  if (category.empty() || question.empty() || answer.empty()) {
    return create_json_response(create_error_response("Missing required fields"), 400);
  }

  try {
    auto result = ingestion_service_->add_document(category, question, answer);
    return create_json_response({{"success", result.success}, {"message", result.message}});
  } catch (const std::exception &e) {
    record_error("Exception in handle_add_document: " + std::string(e.what()));
    nlohmann::json response = {{"success", false}, {"message", e.what()}};
    return create_json_response(response, 500);
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  try {
    nlohmann::json stats = metrics_collector_->session_stats();
    stats["index_size"] = document_index_->size();
    stats["recent_errors"] = metrics_collector_->recent_errors();

    nlohmann::json response = create_success_response("Session statistics", stats);
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_stats: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

std::string Routes::sanitize_filename(const std::string &filename) {
  // Browsers may send a full client path; Windows ones use backslashes
  auto last_separator = filename.find_last_of("/\\");
  std::string base =
      last_separator == std::string::npos ? filename : filename.substr(last_separator + 1);

  std::string sanitized;
  sanitized.reserve(base.size());
  for (unsigned char c : base) {
    if (std::isalnum(c) || c == '.' || c == '-' || c == '_') {
      sanitized.push_back(static_cast<char>(c));
    } else if (c == ' ') {
      sanitized.push_back('_');
    }
  }
  // No hidden files and no "." or ".."
  size_t first = sanitized.find_first_not_of('.');
  return first == std::string::npos ? "" : sanitized.substr(first);
}

void Routes::record_error(const std::string &error) {
  std::cerr << error << std::endl;
  if (metrics_collector_) {
    metrics_collector_->record_error(error);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace finbot_api
