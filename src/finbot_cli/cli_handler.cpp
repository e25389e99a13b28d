#include "finbot_cli/cli_handler.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <memory>

namespace finbot_cli {

namespace {

// Collects "--flag value" pairs after the command word
template <typename Setter>
void parse_flags(int argc, char* argv[], Setter&& set) {
    for (int i = 2; i < argc; i += 2) {
        if (i + 1 >= argc) {
            throw CliError(std::string("Missing value for ") + argv[i]);
        }
        set(std::string(argv[i]), std::string(argv[i + 1]));
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        parse_flags(argc, argv, [&options](const std::string& flag, const std::string& value) {
            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--verbose" || flag == "-v") {
                options.verbose = value == "true" || value == "1";
            }
        });
        if (options.query.empty()) {
            throw CliError("Ask command requires a query. Usage: ask --query <question>");
        }
    } else if (command == "add") {
        options.command = Command::Add;
        parse_flags(argc, argv, [&options](const std::string& flag, const std::string& value) {
            if (flag == "--category" || flag == "-c") {
                options.category = value;
            } else if (flag == "--question" || flag == "-q") {
                options.question = value;
            } else if (flag == "--answer" || flag == "-a") {
                options.answer = value;
            }
        });
        if (options.category.empty() || options.question.empty() || options.answer.empty()) {
            throw CliError(
                "Add command requires a category, question and answer. "
                "Usage: add --category <c> --question <q> --answer <a>");
        }
    } else if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        parse_flags(argc, argv, [&options](const std::string& flag, const std::string& value) {
            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            }
        });
        if (options.file_path.empty()) {
            throw CliError("Upload command requires a file path. Usage: upload --file <path>");
        }
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'finbot_cli help' for usage.");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Add:
            handle_add_command(options);
            break;
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Health:
            handle_health_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request = {{"query", options.query}};
    auto response = make_post_request("/api/query", request);
    if (options.verbose) {
        print_json_response(response);
        return;
    }
    print_answer(response);
}

void CliHandler::handle_add_command(const CliOptions& options) {
    nlohmann::json request = {
        {"category", options.category},
        {"question", options.question},
        {"answer", options.answer},
    };
    auto response = make_post_request("/api/add-document", request);
    std::cout << response.value("message", std::string("No message returned")) << std::endl;
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    if (!std::filesystem::exists(options.file_path)) {
        throw CliError("File not found: " + options.file_path);
    }
    std::cout << "Uploading file: " << options.file_path << std::endl;
    auto response = make_upload_request("/api/upload", options.file_path);
    std::cout << response.value("message", std::string("No message returned")) << std::endl;
}

void CliHandler::handle_stats_command(const CliOptions& options) {
    auto response = make_get_request("/api/stats");
    if (!response.contains("data")) {
        print_json_response(response);
        return;
    }
    const auto& stats = response["data"];
    std::cout << "\n=== Finbot Session Statistics ===" << std::endl;
    std::cout << "Indexed chunks:        " << stats.value("index_size", 0) << std::endl;
    std::cout << "Total queries:         " << stats.value("total_queries", 0) << std::endl;
    std::cout << "Avg response time:     " << std::fixed << std::setprecision(1)
              << stats.value("average_response_time_ms", 0.0) << " ms" << std::endl;
    std::cout << "Jailbreak attempts:    " << stats.value("jailbreak_attempts", 0) << std::endl;
    std::cout << "Out-of-domain queries: " << stats.value("out_of_domain_queries", 0) << std::endl;
    std::cout << "Errors:                " << stats.value("error_count", 0) << std::endl;
    std::cout << "Session start:         " << stats.value("session_start", std::string()) << std::endl;
}

void CliHandler::handle_health_command(const CliOptions& options) {
    auto response = make_get_request("/");
    std::cout << response.value("message", std::string()) << " (status: "
              << response.value("status", std::string("unknown"))
              << ", version: " << response.value("version", std::string("unknown")) << ")"
              << std::endl;
}

nlohmann::json CliHandler::perform_request(const std::string& url, const std::string& response_buffer) {
    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    auto body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string detail = body.is_object() ? body.value("error", body.value("message", std::string()))
                                              : std::string();
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                       (detail.empty() ? "" : " (" + detail + ")"));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(url, response_buffer);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::string response_buffer;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

    return perform_request(url, response_buffer);
}

nlohmann::json CliHandler::make_upload_request(const std::string& endpoint, const std::string& file_path) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl_handle_),
                                                               curl_mime_free);
    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, file_path.c_str()) != CURLE_OK) {
        throw CliError("Failed to read file: " + file_path);
    }

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(url, response_buffer);
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_answer(const nlohmann::json& response) {
    std::cout << "\n" << response.value("response", std::string()) << std::endl;
    if (response.contains("sources") && response["sources"].is_array() && !response["sources"].empty()) {
        std::cout << "\nSources:" << std::endl;
        for (const auto& source : response["sources"]) {
            std::cout << "  - " << source.get<std::string>() << std::endl;
        }
    }
    if (response.value("is_jailbreak", false)) {
        std::cout << "\n[flagged: jailbreak attempt]" << std::endl;
    } else if (response.value("is_out_of_domain", false)) {
        std::cout << "\n[flagged: out of domain]" << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
Finbot CLI - Banking assistant client

Usage: finbot_cli <command> [options]

Commands:
  ask, a        Ask the assistant a question
    --query, -q <text>       Question to ask
    --verbose, -v <true>     Print the raw JSON response

  add           Add one question/answer pair to the knowledge base
    --category, -c <name>    Category of the entry
    --question, -q <text>    Question text
    --answer, -a <text>      Answer text

  upload, u     Upload a knowledge file (.json, .csv, .tsv, .txt)
    --file, -f <path>        Path to the file

  stats         Show session statistics
  health        Check that the server is up
  help, h       Show this help message

Environment:
  API_BASE_URL  Server address (default: http://127.0.0.1:5014)
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace finbot_cli
