#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "passage_core/retrieval/context_assembler.hpp"
#include "passage_core/retrieval/retriever.hpp"
#include "passage_core/services/answer_service.hpp"

namespace passage_core {

enum class AnswerMode { Retrieval, GenerationOnly };

std::string to_string(AnswerMode mode);

struct AnswerResult {
  std::string answer;
  std::vector<SourceSummary> sources;
  std::string context;
  AnswerMode mode = AnswerMode::Retrieval;
  // Why retrieval was skipped when mode is GenerationOnly
  std::optional<std::string> retrieval_error;
};

/**
 * @class QuestionService
 * @brief End-to-end ask flow: retrieve, assemble context, answer.
 *
 * Retrieval runs under a timeout on its own thread. When there is no usable
 * index, retrieval fails or the timeout expires, the question is answered
 * without context instead. A dimension mismatch is a configuration error and
 * is not hidden.
 *
 * A search that times out keeps running until it returns. At most
 * max_in_flight searches run at once; beyond that, questions are answered
 * without context until one finishes.
 */
class QuestionService {
 public:
  static constexpr size_t DEFAULT_MAX_IN_FLIGHT = 4;

  QuestionService(std::shared_ptr<Retriever> retriever,
                  std::shared_ptr<AnswerService> answer_service,
                  std::chrono::milliseconds retrieval_timeout,
                  size_t max_context_chars = ContextAssembler::DEFAULT_MAX_CHARS,
                  size_t max_in_flight = DEFAULT_MAX_IN_FLIGHT);

  AnswerResult ask(const std::string &query, int top_k = Retriever::DEFAULT_TOP_K);

  // @throw RetrievalError if the search does not finish within the timeout or
  // too many searches are already running
  std::vector<RetrievalResult> search_with_timeout(const std::string &query, int top_k);

  size_t searches_in_flight() const;

  // Blocks until no search thread is running or timeout expires. Returns true
  // when idle. Call before shutting down the database.
  bool wait_for_idle(std::chrono::milliseconds timeout) const;

 private:
  // Shared with the search threads, which may outlive the service
  struct InFlight {
    std::mutex mutex;
    std::condition_variable idle;
    size_t count = 0;
  };

  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<AnswerService> answer_service_;
  std::chrono::milliseconds retrieval_timeout_;
  size_t max_context_chars_;
  size_t max_in_flight_;
  std::shared_ptr<InFlight> in_flight_;
};

}  // namespace passage_core
