#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "passage_core/db/chunk_store.hpp"
#include "passage_core/index/vector_index.hpp"
#include "passage_core/services/embedding_service.hpp"

namespace passage_core {

/**
 * @class RetrievalContext
 * @brief Owns the query-time handles: the embedder and the loaded vector index.
 *
 * Initialization runs at most once successfully. Concurrent callers block
 * until it completes; if it throws, the next call tries again.
 *
 * The index and the chunk rows change together. A search holds read_guard()
 * from picking the index until its slots are joined against the store; a
 * publisher holds swap_guard() while it replaces the index file, commits the
 * rows and installs the new index, so no search sees one without the other.
 */
class RetrievalContext {
 public:
  RetrievalContext(std::shared_ptr<EmbeddingService> embedding_service,
                   std::shared_ptr<ChunkStore> chunk_store,
                   std::filesystem::path index_path);
  virtual ~RetrievalContext() = default;

  RetrievalContext(const RetrievalContext &) = delete;
  RetrievalContext &operator=(const RetrievalContext &) = delete;

  // @throw IndexNotFoundError if no index has been persisted
  // @throw DimensionMismatchError if the embedder and index disagree
  void ensure_initialized();

  // Loads the index from disk and swaps it in under the swap guard.
  void reload();

  std::shared_lock<std::shared_mutex> read_guard() const {
    return std::shared_lock<std::shared_mutex>(swap_mutex_);
  }
  std::unique_lock<std::shared_mutex> swap_guard() {
    return std::unique_lock<std::shared_mutex>(swap_mutex_);
  }

  // Makes index the live one. The caller holds swap_guard() and has already
  // committed the chunk rows that match it.
  void install(std::shared_ptr<const VectorIndex> index);

  bool is_initialized() const { return initialized_.load(std::memory_order_acquire); }
  bool index_exists() const;

  // Calls ensure_initialized()
  std::shared_ptr<const VectorIndex> index();

  EmbeddingService &embedding_service() { return *embedding_service_; }
  ChunkStore &chunk_store() { return *chunk_store_; }
  const std::filesystem::path &index_path() const { return index_path_; }

 private:
  // Requires mutex_ held
  std::shared_ptr<const VectorIndex> load_checked();

  std::shared_ptr<EmbeddingService> embedding_service_;
  std::shared_ptr<ChunkStore> chunk_store_;
  std::filesystem::path index_path_;

  mutable std::shared_mutex swap_mutex_;
  mutable std::mutex mutex_;
  std::atomic<bool> initialized_{false};
  std::shared_ptr<const VectorIndex> index_;
};

}  // namespace passage_core
