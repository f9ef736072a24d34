#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>

namespace passage_cli {

enum class Command { Ingest, Search, Context, Ask, Documents, Stats, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string query;
  int top_k = 5;
  int max_chars = 3000;
  bool raw_json = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const std::string &api_base_url);
  ~CliHandler();

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  CliHandler(CliHandler &&) noexcept;
  CliHandler &operator=(CliHandler &&) noexcept;

  // @throw CliError on unknown commands or missing/invalid flags
  CliOptions parse_arguments(int argc, char *argv[]);

  void execute_command(const CliOptions &options);

  void set_api_base_url(const std::string &url);
  std::string get_api_base_url() const;

  std::string build_url(const std::string &endpoint) const;

 private:
  std::string api_base_url_;
  CURL *curl_handle_;

  // Command handlers
  void handle_ingest_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_context_command(const CliOptions &options);
  void handle_ask_command(const CliOptions &options);
  void handle_documents_command(const CliOptions &options);
  void handle_stats_command(const CliOptions &options);

  // HTTP methods
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  nlohmann::json perform(const std::string &url);

  // Helper methods
  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  void print_json_response(const nlohmann::json &response);
  void print_search_response(const nlohmann::json &response);
  void print_sources(const nlohmann::json &sources);
  void print_error(const std::string &error);
  void print_help();
};

}  // namespace passage_cli
