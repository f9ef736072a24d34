#include "passage_core/services/question_service.hpp"

#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "passage_core/errors.hpp"
#include "passage_core/index/vector_index.hpp"

namespace passage_core {

std::string to_string(AnswerMode mode) {
  switch (mode) {
    case AnswerMode::Retrieval:
      return "retrieval";
    case AnswerMode::GenerationOnly:
      return "generation_only";
    default:
      return "unknown";
  }
}

QuestionService::QuestionService(std::shared_ptr<Retriever> retriever,
                                 std::shared_ptr<AnswerService> answer_service,
                                 std::chrono::milliseconds retrieval_timeout,
                                 size_t max_context_chars,
                                 size_t max_in_flight)
    : retriever_(std::move(retriever)),
      answer_service_(std::move(answer_service)),
      retrieval_timeout_(retrieval_timeout),
      max_context_chars_(max_context_chars),
      max_in_flight_(max_in_flight),
      in_flight_(std::make_shared<InFlight>()) {
  if (max_in_flight_ == 0) {
    throw std::invalid_argument("max_in_flight must be greater than 0");
  }
}

size_t QuestionService::searches_in_flight() const {
  std::lock_guard<std::mutex> lock(in_flight_->mutex);
  return in_flight_->count;
}

bool QuestionService::wait_for_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(in_flight_->mutex);
  return in_flight_->idle.wait_for(lock, timeout, [this] { return in_flight_->count == 0; });
}

std::vector<RetrievalResult> QuestionService::search_with_timeout(const std::string &query,
                                                                  int top_k) {
  {
    std::lock_guard<std::mutex> lock(in_flight_->mutex);
    if (in_flight_->count >= max_in_flight_) {
      throw RetrievalError("Too many searches in progress (" + std::to_string(in_flight_->count) +
                           ")");
    }
    ++in_flight_->count;
  }

  // The task owns a reference to the retriever so an abandoned search can
  // still finish safely after this call returns.
  auto task = std::make_shared<std::packaged_task<std::vector<RetrievalResult>()>>(
      [retriever = retriever_, query, top_k]() { return retriever->search(query, top_k); });
  std::future<std::vector<RetrievalResult>> future = task->get_future();
  try {
    std::thread([task, in_flight = in_flight_]() {
      // packaged_task stores any exception in the future
      (*task)();
      std::lock_guard<std::mutex> lock(in_flight->mutex);
      --in_flight->count;
      in_flight->idle.notify_all();
    }).detach();
  } catch (const std::system_error &e) {
    std::lock_guard<std::mutex> lock(in_flight_->mutex);
    --in_flight_->count;
    in_flight_->idle.notify_all();
    throw RetrievalError("Could not start search thread: " + std::string(e.what()));
  }

  if (future.wait_for(retrieval_timeout_) != std::future_status::ready) {
    throw RetrievalError("Retrieval timed out after " +
                         std::to_string(retrieval_timeout_.count()) + " ms");
  }
  return future.get();
}

AnswerResult QuestionService::ask(const std::string &query, int top_k) {
  AnswerResult result;

  std::vector<RetrievalResult> results;
  try {
    results = search_with_timeout(query, top_k);
  } catch (const IndexNotFoundError &e) {
    std::cerr << "Warning: " << e.what() << " Answering without documents." << std::endl;
    result.mode = AnswerMode::GenerationOnly;
    result.retrieval_error = e.what();
  } catch (const RetrievalError &e) {
    std::cerr << "Warning: " << e.what() << ". Answering without documents." << std::endl;
    result.mode = AnswerMode::GenerationOnly;
    result.retrieval_error = e.what();
  } catch (const VectorIndexError &e) {
    std::cerr << "Warning: unreadable vector index: " << e.what()
              << ". Answering without documents." << std::endl;
    result.mode = AnswerMode::GenerationOnly;
    result.retrieval_error = e.what();
  }

  if (result.mode == AnswerMode::GenerationOnly) {
    result.answer = answer_service_->quick_answer(query);
    return result;
  }

  result.context = ContextAssembler::assemble(results, max_context_chars_);
  result.sources = ContextAssembler::summarize_sources(results);
  result.answer = answer_service_->answer(query, result.context);
  return result;
}

}  // namespace passage_core
