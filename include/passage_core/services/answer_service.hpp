#pragma once

#include <memory>
#include <string>

#include "passage_core/llm/ollama_client.hpp"

namespace passage_core {

/**
 * @class AnswerService
 * @brief Produces an answer to a question from retrieved context.
 *
 * Uses the configured generation model when there is one. Without it, or
 * when generation fails, the answer quotes the context back with a short
 * explanation instead.
 */
class AnswerService {
 public:
  // Trimmed context shorter than this is treated as no context
  static constexpr size_t MIN_CONTEXT_CHARS = 50;
  static constexpr const char *NO_CONTEXT_MESSAGE =
      "No relevant information found in the indexed documents.";

  explicit AnswerService(std::shared_ptr<OllamaClient> ollama_client);
  virtual ~AnswerService() = default;

  virtual std::string answer(const std::string &query, const std::string &context);

  // Generation without retrieval, used when no index exists yet
  virtual std::string quick_answer(const std::string &query);

  bool generation_available() const { return ollama_client_->has_generation_model(); }

  static std::string build_prompt(const std::string &query, const std::string &context);
  static std::string fallback_answer(const std::string &query, const std::string &context);
  static std::string setup_instructions();

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
};

}  // namespace passage_core
