#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace voxrag_cli
{

  enum class Command
  {
    Ask,
    Retrieve,
    Start,
    History,
    End,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string session_id;
    std::string query;
    int top_k;
    bool verbose;
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

    // Execute command. Throws CliError when the API call fails.
    void execute_command(const CliOptions &options);

    // Set API base URL
    void set_api_base_url(const std::string &url);

    // Get API base URL
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ask_command(const CliOptions &options);
    void handle_retrieve_command(const CliOptions &options);
    void handle_start_command(const CliOptions &options);
    void handle_history_command(const CliOptions &options);
    void handle_end_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_query_response(const nlohmann::json &response, bool verbose);
    void print_retrieve_response(const nlohmann::json &response);
    void print_history_response(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint);
    std::string encode_path_segment(const std::string &segment);
  };

}
