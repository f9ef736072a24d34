#include "passage_core/retrieval/retrieval_context.hpp"

#include <iostream>
#include <stdexcept>

#include "passage_core/errors.hpp"

namespace passage_core {

RetrievalContext::RetrievalContext(std::shared_ptr<EmbeddingService> embedding_service,
                                   std::shared_ptr<ChunkStore> chunk_store,
                                   std::filesystem::path index_path)
    : embedding_service_(std::move(embedding_service)),
      chunk_store_(std::move(chunk_store)),
      index_path_(std::move(index_path)) {}

bool RetrievalContext::index_exists() const {
  return std::filesystem::exists(index_path_);
}

std::shared_ptr<const VectorIndex> RetrievalContext::load_checked() {
  std::cout << "[Retrieval] Loading vector index from " << index_path_.string() << std::endl;
  auto index = std::make_shared<const VectorIndex>(VectorIndex::load(index_path_));

  const size_t dimension = embedding_service_->dimension();
  if (index->dimension() != dimension) {
    throw DimensionMismatchError(index->dimension(), dimension, "Retrieval");
  }

  const size_t chunk_count = chunk_store_->chunk_count();
  if (chunk_count != index->size()) {
    std::cerr << "Warning: vector index holds " << index->size() << " vectors but the chunk store "
              << "holds " << chunk_count << " chunks. Re-run ingestion." << std::endl;
  }
  return index;
}

void RetrievalContext::ensure_initialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }
  index_ = load_checked();
  initialized_.store(true, std::memory_order_release);
  std::cout << "[Retrieval] Ready with " << index_->size() << " vectors" << std::endl;
}

void RetrievalContext::reload() {
  auto swap = swap_guard();
  std::lock_guard<std::mutex> lock(mutex_);
  // Load fully before touching the current handle
  std::shared_ptr<const VectorIndex> fresh = load_checked();
  index_ = std::move(fresh);
  initialized_.store(true, std::memory_order_release);
  std::cout << "[Retrieval] Reloaded index with " << index_->size() << " vectors" << std::endl;
}

void RetrievalContext::install(std::shared_ptr<const VectorIndex> index) {
  if (!index) {
    throw std::invalid_argument("Cannot install an empty index handle");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  index_ = std::move(index);
  initialized_.store(true, std::memory_order_release);
  std::cout << "[Retrieval] Installed index with " << index_->size() << " vectors" << std::endl;
}

std::shared_ptr<const VectorIndex> RetrievalContext::index() {
  ensure_initialized();
  std::lock_guard<std::mutex> lock(mutex_);
  return index_;
}

}  // namespace passage_core
