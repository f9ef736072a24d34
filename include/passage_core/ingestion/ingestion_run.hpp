#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "passage_core/types/chunk.hpp"
#include "passage_core/types/document.hpp"

namespace passage_core {

// A chunk waiting to be written. staged_document indexes IngestionRun::documents().
struct StagedChunk {
  int slot_id;
  size_t staged_document;
  int page_number;
  std::string text;
};

/**
 * @class IngestionRun
 * @brief Collects the documents and chunks of one ingestion before anything is persisted.
 *
 * Slots are handed out densely from 0 in insertion order. The i-th text
 * returned by texts() must become the i-th vector of the index built for
 * this run.
 */
class IngestionRun {
 public:
  IngestionRun() = default;

  IngestionRun(const IngestionRun &) = delete;
  IngestionRun &operator=(const IngestionRun &) = delete;
  IngestionRun(IngestionRun &&) = default;
  IngestionRun &operator=(IngestionRun &&) = default;

  // Returns the staged index used by insert()
  size_t add_document(DocumentRecord document);

  // Returns the slot assigned to the chunk
  // @throw std::out_of_range if staged_document was not returned by add_document()
  int insert(size_t staged_document, int page_number, std::string text);

  // Re-stages chunks persisted by an earlier run under fresh slots, keeping
  // their page numbers and text. Returns the number of chunks staged.
  size_t carry_over(size_t staged_document, const std::vector<ChunkRecord> &prior_chunks);

  const std::vector<DocumentRecord> &documents() const { return documents_; }
  const std::vector<StagedChunk> &chunks() const { return chunks_; }

  // Chunk texts in slot order
  std::vector<std::string> texts() const;

  size_t size() const { return chunks_.size(); }
  bool empty() const { return chunks_.empty(); }

 private:
  std::vector<DocumentRecord> documents_;
  std::vector<StagedChunk> chunks_;
};

}  // namespace passage_core
