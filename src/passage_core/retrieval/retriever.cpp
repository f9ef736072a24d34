#include "passage_core/retrieval/retriever.hpp"

#include <iostream>

#include "passage_core/errors.hpp"
#include "passage_core/llm/ollama_client.hpp"

namespace passage_core {

Retriever::Retriever(std::shared_ptr<RetrievalContext> context) : context_(std::move(context)) {}

std::vector<RetrievalResult> Retriever::search(const std::string &query, int top_k) {
  if (top_k <= 0 || query.find_first_not_of(" \t\n\r\f\v") == std::string::npos) {
    return {};
  }

  // Initialization asks the embedding model for its dimension, so an
  // unreachable server surfaces here as well as on the query itself
  try {
    context_->ensure_initialized();
  } catch (const OllamaError &e) {
    throw RetrievalError("Embedding model unavailable: " + std::string(e.what()));
  }

  std::vector<float> query_vector;
  try {
    query_vector = context_->embedding_service().embed_one(query);
  } catch (const OllamaError &e) {
    throw RetrievalError("Failed to embed query: " + std::string(e.what()));
  }

  // Index search and slot join must see the same ingestion run
  auto read_guard = context_->read_guard();
  std::shared_ptr<const VectorIndex> index = context_->index();

  const std::vector<SearchHit> hits = index->search(query_vector, top_k);
  if (hits.empty()) {
    return {};
  }

  std::vector<int> slots;
  slots.reserve(hits.size());
  for (const auto &hit : hits) {
    slots.push_back(hit.slot_id);
  }
  const auto stored = context_->chunk_store().get_by_slots(slots);
  read_guard.unlock();

  std::vector<RetrievalResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    auto it = stored.find(hit.slot_id);
    if (it == stored.end()) {
      std::cerr << "Warning: no chunk stored for slot " << hit.slot_id << ", dropping result"
                << std::endl;
      continue;
    }
    const StoredChunk &chunk = it->second;

    RetrievalResult result;
    result.slot_id = hit.slot_id;
    result.document = chunk.document.filename;
    result.document_title = chunk.document.title;
    result.page = chunk.chunk.page_number;
    result.text = chunk.chunk.text;
    result.score = hit.distance;
    result.rank = static_cast<int>(results.size()) + 1;
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace passage_core
