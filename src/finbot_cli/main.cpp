#include "finbot_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

namespace
{

  // libcurl global state for the whole process
  struct CurlGlobal
  {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
  };

}

int main(int argc, char *argv[])
{
  CurlGlobal curl_global;

  const char *api_base_url = std::getenv("API_BASE_URL");
  std::string base_url = api_base_url && *api_base_url ? api_base_url : "http://127.0.0.1:5014";

  try
  {
    finbot_cli::CliHandler handler(base_url);
    finbot_cli::CliOptions options = handler.parse_arguments(argc, argv);
    handler.execute_command(options);
  }
  catch (const finbot_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  catch (const nlohmann::json::exception &e)
  {
    std::cerr << "Error: unexpected response from " << base_url << ": " << e.what() << std::endl;
    return 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
