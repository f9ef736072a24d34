#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "passage_core/llm/ollama_client.hpp"

namespace passage_core {

/**
 * @class EmbeddingService
 * @brief Maps text to fixed-dimension vectors through the embedding model.
 *
 * The model is probed once per process to learn its dimension. Every vector
 * produced afterwards must have that dimension. Texts are sent in batches of
 * batch_size; batch boundaries do not affect any output vector.
 */
class EmbeddingService {
 public:
  static constexpr size_t DEFAULT_BATCH_SIZE = 32;

  EmbeddingService(std::shared_ptr<OllamaClient> ollama_client,
                   size_t batch_size = DEFAULT_BATCH_SIZE);
  virtual ~EmbeddingService() = default;

  EmbeddingService(const EmbeddingService &) = delete;
  EmbeddingService &operator=(const EmbeddingService &) = delete;

  // Idempotent and safe to call from many threads; concurrent callers block
  // until the first one finishes. A failed probe is retried on the next call.
  virtual void ensure_ready();

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts);
  virtual std::vector<float> embed_one(const std::string &text);

  // Calls ensure_ready()
  virtual size_t dimension();

  virtual std::string model_name() const;

  size_t batch_size() const { return batch_size_; }

 private:
  void check_dimension(const std::vector<float> &vector) const;

  std::shared_ptr<OllamaClient> ollama_client_;
  size_t batch_size_;

  std::mutex init_mutex_;
  std::atomic<bool> ready_{false};
  size_t dimension_ = 0;
};

}  // namespace passage_core
