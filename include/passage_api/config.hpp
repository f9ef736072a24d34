#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  std::string index_path;
  std::string documents_directory;
  std::string ollama_url;
  std::string embedding_model;
  // Empty disables generation; answers fall back to quoting the context
  std::string generation_model;
  int embedding_batch_size;
  int db_pool_size;

  // Chunking
  int chunk_window_words;
  int chunk_overlap_words;
  int min_chunk_chars;

  // Retrieval
  int default_top_k;
  int max_context_chars;
  int retrieval_timeout_ms;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.database_path = json_config.value("database_path", std::string("./data/passage.db"));
    config.index_path = json_config.value("index_path", std::string("./data/index/faiss.index"));
    config.documents_directory =
        json_config.value("documents_directory", std::string("./data/documents"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
    config.generation_model = json_config.value("generation_model", std::string(""));

    config.embedding_batch_size = int_value(json_config, "embedding_batch_size", 32);
    config.db_pool_size = int_value(json_config, "db_pool_size", 4);
    config.chunk_window_words = int_value(json_config, "chunk_window_words", 500);
    config.chunk_overlap_words = int_value(json_config, "chunk_overlap_words", 100);
    config.min_chunk_chars = int_value(json_config, "min_chunk_chars", 50);
    config.default_top_k = int_value(json_config, "default_top_k", 5);
    config.max_context_chars = int_value(json_config, "max_context_chars", 3000);
    config.retrieval_timeout_ms = int_value(json_config, "retrieval_timeout_ms", 30000);

    config.validate();
    return config;
  }

 private:
  // Wrong types are a configuration error, not a silent default
  static int int_value(const nlohmann::json& json_config, const std::string& key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    try {
      return json_config.at(key).get<int>();
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(key + " must be an integer: " + e.what());
    }
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (documents_directory.empty()) {
      throw std::runtime_error("documents_directory cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (chunk_window_words <= 0) {
      throw std::runtime_error("chunk_window_words must be greater than 0");
    }
    if (chunk_overlap_words < 0 || chunk_overlap_words >= chunk_window_words) {
      throw std::runtime_error("chunk_overlap_words must be in [0, chunk_window_words)");
    }
    if (min_chunk_chars < 0) {
      throw std::runtime_error("min_chunk_chars cannot be negative");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
    if (max_context_chars <= 0) {
      throw std::runtime_error("max_context_chars must be greater than 0");
    }
    if (retrieval_timeout_ms < 100) {
      throw std::runtime_error("retrieval_timeout_ms must be at least 100ms");
    }
  }
};
