#include "passage_core/services/embedding_service.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "passage_core/errors.hpp"

namespace passage_core {

EmbeddingService::EmbeddingService(std::shared_ptr<OllamaClient> ollama_client, size_t batch_size)
    : ollama_client_(std::move(ollama_client)), batch_size_(batch_size) {
  if (!ollama_client_) {
    throw std::invalid_argument("EmbeddingService requires an Ollama client");
  }
  if (batch_size_ == 0) {
    throw std::invalid_argument("Embedding batch size must be greater than 0");
  }
}

void EmbeddingService::ensure_ready() {
  if (ready_.load(std::memory_order_acquire)) {
    return;
  }
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (ready_.load(std::memory_order_relaxed)) {
    return;
  }

  std::cout << "[Embedding] Loading embedding model " << ollama_client_->embedding_model()
            << "..." << std::endl;
  std::vector<float> probe = ollama_client_->get_embedding("dimension probe");
  if (probe.empty()) {
    throw OllamaError("Embedding model returned an empty vector");
  }
  dimension_ = probe.size();
  ready_.store(true, std::memory_order_release);
  std::cout << "[Embedding] Model ready, dimension " << dimension_ << std::endl;
}

size_t EmbeddingService::dimension() {
  ensure_ready();
  return dimension_;
}

std::string EmbeddingService::model_name() const {
  return ollama_client_->embedding_model();
}

void EmbeddingService::check_dimension(const std::vector<float> &vector) const {
  if (vector.empty()) {
    throw OllamaError("Received empty embedding");
  }
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size(), "Embedding model");
  }
}

std::vector<std::vector<float>> EmbeddingService::embed(const std::vector<std::string> &texts) {
  ensure_ready();

  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += batch_size_) {
    const size_t end = std::min(start + batch_size_, texts.size());
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

    std::vector<std::vector<float>> batch_vectors = ollama_client_->get_embeddings(batch);
    if (batch_vectors.size() != batch.size()) {
      throw OllamaError("Embedding batch returned " + std::to_string(batch_vectors.size()) +
                        " vectors for " + std::to_string(batch.size()) + " texts");
    }
    for (auto &vector : batch_vectors) {
      check_dimension(vector);
      vectors.push_back(std::move(vector));
    }

    if (texts.size() > batch_size_) {
      std::cout << "[Embedding] Embedded " << end << " of " << texts.size() << " texts"
                << std::endl;
    }
  }
  return vectors;
}

std::vector<float> EmbeddingService::embed_one(const std::string &text) {
  ensure_ready();
  std::vector<float> vector = ollama_client_->get_embedding(text);
  check_dimension(vector);
  return vector;
}

}  // namespace passage_core
