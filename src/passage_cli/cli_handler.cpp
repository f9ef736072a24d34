#include "passage_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>
#include <memory>

namespace passage_cli {

namespace {

int parse_int_flag(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid value for " + flag + ": " + value);
  }
}

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
  setup_curl_handle();
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

CliHandler::CliHandler(CliHandler &&other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

CliHandler &CliHandler::operator=(CliHandler &&other) noexcept {
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

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = argv[1];
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "context" || command == "c") {
    options.command = Command::Context;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "documents" || command == "d") {
    options.command = Command::Documents;
  } else if (command == "stats") {
    options.command = Command::Stats;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--json") {
      options.raw_json = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    const std::string value = argv[++i];
    if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int_flag(flag, value);
    } else if (flag == "--max-chars" || flag == "-m") {
      options.max_chars = parse_int_flag(flag, value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  const bool needs_query = options.command == Command::Search ||
                           options.command == Command::Context || options.command == Command::Ask;
  if (needs_query && options.query.empty()) {
    throw CliError(command + " requires a query. Usage: " + command + " --query <query>");
  }
  if (options.top_k <= 0) {
    throw CliError("--top-k must be greater than 0");
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Context:
      handle_context_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Documents:
      handle_documents_command(options);
      break;
    case Command::Stats:
      handle_stats_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::cout << "Ingesting documents. This can take a while..." << std::endl;
  try {
    nlohmann::json response = make_post_request("/ingest", nlohmann::json::object());
    if (options.raw_json) {
      print_json_response(response);
      return;
    }
    const auto &data = response["data"];
    std::cout << "Indexed " << data.value("chunks_indexed", 0) << " chunks from "
              << data.value("documents_indexed", 0) << " documents (dimension "
              << data.value("dimension", 0) << ")" << std::endl;
    if (data.contains("documents_skipped")) {
      for (const auto &skipped : data["documents_skipped"]) {
        std::cout << "  skipped: " << skipped.get<std::string>() << std::endl;
      }
    }
  } catch (const std::exception &e) {
    print_error("Failed to ingest: " + std::string(e.what()));
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")"
            << std::endl;
  nlohmann::json request_data = {{"query", options.query}, {"top_k", options.top_k}};
  try {
    nlohmann::json response = make_post_request("/search", request_data);
    if (options.raw_json) {
      print_json_response(response);
    } else {
      print_search_response(response);
    }
  } catch (const std::exception &e) {
    print_error("Failed to search: " + std::string(e.what()));
  }
}

void CliHandler::handle_context_command(const CliOptions &options) {
  nlohmann::json request_data = {
      {"query", options.query}, {"top_k", options.top_k}, {"max_chars", options.max_chars}};
  try {
    nlohmann::json response = make_post_request("/context", request_data);
    if (options.raw_json) {
      print_json_response(response);
      return;
    }
    std::cout << response["data"].value("context", "") << std::endl;
  } catch (const std::exception &e) {
    print_error("Failed to assemble context: " + std::string(e.what()));
  }
}

void CliHandler::handle_ask_command(const CliOptions &options) {
  nlohmann::json request_data = {{"query", options.query}, {"top_k", options.top_k}};
  try {
    nlohmann::json response = make_post_request("/ask", request_data);
    if (options.raw_json) {
      print_json_response(response);
      return;
    }
    const auto &data = response["data"];
    std::cout << "\n" << data.value("answer", "") << std::endl;
    if (data.value("mode", "") == "generation_only") {
      std::cout << "\n(answered without documents: " << data.value("retrieval_error", "")
                << ")" << std::endl;
    }
    if (data.contains("sources")) {
      print_sources(data["sources"]);
    }
  } catch (const std::exception &e) {
    print_error("Failed to ask: " + std::string(e.what()));
  }
}

void CliHandler::handle_documents_command(const CliOptions &options) {
  try {
    nlohmann::json response = make_get_request("/documents");
    if (options.raw_json) {
      print_json_response(response);
      return;
    }
    const auto &documents = response["data"]["documents"];
    if (documents.empty()) {
      std::cout << "No documents indexed." << std::endl;
      return;
    }
    for (const auto &document : documents) {
      std::cout << "  - " << document.value("filename", "") << " (" << document.value("type", "")
                << ", " << document.value("pages", 0) << " pages, " << document.value("size", 0)
                << " bytes)" << std::endl;
    }
  } catch (const std::exception &e) {
    print_error("Failed to list documents: " + std::string(e.what()));
  }
}

void CliHandler::handle_stats_command(const CliOptions &) {
  try {
    print_json_response(make_get_request("/stats")["data"]);
  } catch (const std::exception &e) {
    print_error("Failed to get stats: " + std::string(e.what()));
  }
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }
  curl_easy_reset(curl_handle_);
  return perform(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }
  const std::string request_json = data.dump();

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  return perform(build_url(endpoint));
}

nlohmann::json CliHandler::perform(const std::string &url) {
  std::string response_buffer;
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    // The server reports failures as {"success": false, "error": "..."}
    auto body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
    std::string detail = body.is_object() ? body.value("error", "") : "";
    throw CliError("HTTP " + std::to_string(http_code) + (detail.empty() ? "" : ": " + detail));
  }

  return nlohmann::json::parse(response_buffer);
}

void CliHandler::set_api_base_url(const std::string &url) {
  api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

std::string CliHandler::build_url(const std::string &endpoint) const {
  std::string base = api_base_url_;
  if (base.find("://") == std::string::npos) {
    base = "http://" + base;
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_search_response(const nlohmann::json &response) {
  std::cout << "\n=== Search Results ===" << std::endl;
  const auto &results = response["data"]["results"];
  if (!results.is_array() || results.empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }
  for (const auto &result : results) {
    std::string text = result.value("text", "");
    std::cout << "  " << result.value("rank", 0) << ". " << result.value("document", "")
              << ", page " << result.value("page", 0) << " | distance: " << std::fixed
              << std::setprecision(3) << result.value("score", 0.0f) << std::endl;
    std::cout << "     " << text.substr(0, 100) << (text.size() > 100 ? "..." : "") << std::endl
              << std::endl;
  }
}

void CliHandler::print_sources(const nlohmann::json &sources) {
  if (!sources.is_array() || sources.empty()) {
    return;
  }
  std::cout << "\nSources:" << std::endl;
  for (const auto &source : sources) {
    std::cout << "  - " << source.value("document", "") << ", page " << source.value("page", 0)
              << std::endl;
  }
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << R"(
Passage CLI - Document retrieval over an indexed corpus

Usage: passage_cli <command> [options]

Commands:
  ingest, i       Rebuild the index from the documents directory

  search, s       Find the passages nearest to a query
    --query, -q <query>    Search query
    --top-k, -k <num>      Number of results to return (default: 5)

  context, c      Assemble source-tagged context for a query
    --query, -q <query>    Search query
    --top-k, -k <num>      Number of results to use (default: 5)
    --max-chars, -m <num>  Context budget in characters (default: 3000)

  ask, a          Answer a question from the indexed documents
    --query, -q <query>    Question
    --top-k, -k <num>      Number of passages to use (default: 5)

  documents, d    List indexed documents
  stats           Show index and store statistics
  help, h         Show this help

Options:
  --json          Print the raw JSON response

Environment:
  API_BASE_URL    Server address (default: http://127.0.0.1:3030)
)" << std::endl;
}

}  // namespace passage_cli
