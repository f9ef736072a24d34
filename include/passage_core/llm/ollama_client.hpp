#pragma once

#include <string>
#include <vector>

namespace passage_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient {
 public:
  // generation_model may be empty, in which case generate() is unavailable
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model = "");
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get embedding for text
  virtual std::vector<float> get_embedding(const std::string &text);
  // One request for the whole batch; output order matches input order
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  virtual std::string generate(const std::string &prompt);

  virtual bool is_server_available();

  bool has_generation_model() const { return !generation_model_.empty(); }
  const std::string &embedding_model() const { return embedding_model_; }
  const std::string &generation_model() const { return generation_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
};

}  // namespace passage_core
