#pragma once

#include <exception>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace finbot_cli
{

  enum class Command
  {
    Ask,
    Add,
    Upload,
    Stats,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    std::string category;
    std::string question;
    std::string answer;
    std::string file_path;
    bool verbose = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ask_command(const CliOptions &options);
    void handle_add_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);
    void handle_health_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_upload_request(const std::string &endpoint, const std::string &file_path);

    // Helper methods
    void setup_curl_handle();
    // Runs the prepared request; non-200 statuses throw CliError with the server's message
    nlohmann::json perform_request(const std::string &url, const std::string &response_buffer);
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_answer(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
