#include "passage_core/ingestion/ingestion_run.hpp"

#include <stdexcept>

namespace passage_core {

size_t IngestionRun::add_document(DocumentRecord document) {
  documents_.push_back(std::move(document));
  return documents_.size() - 1;
}

int IngestionRun::insert(size_t staged_document, int page_number, std::string text) {
  if (staged_document >= documents_.size()) {
    throw std::out_of_range("No staged document at index " + std::to_string(staged_document));
  }
  const int slot_id = static_cast<int>(chunks_.size());
  chunks_.push_back({slot_id, staged_document, page_number, std::move(text)});
  return slot_id;
}

size_t IngestionRun::carry_over(size_t staged_document,
                               const std::vector<ChunkRecord> &prior_chunks) {
  for (const auto &prior : prior_chunks) {
    insert(staged_document, prior.page_number, prior.text);
  }
  return prior_chunks.size();
}

std::vector<std::string> IngestionRun::texts() const {
  std::vector<std::string> result;
  result.reserve(chunks_.size());
  for (const auto &chunk : chunks_) {
    result.push_back(chunk.text);
  }
  return result;
}

}  // namespace passage_core
