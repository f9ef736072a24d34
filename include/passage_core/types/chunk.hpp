#pragma once

#include <string>

#include "passage_core/types/document.hpp"

namespace passage_core {

// A word window taken from one page of one document. slot_id is the position
// of its embedding inside the vector index.
struct ChunkRecord {
  int slot_id = -1;
  int document_id = 0;
  int page_number = 0;
  std::string text;
};

// A chunk joined with the document it came from
struct StoredChunk {
  ChunkRecord chunk;
  DocumentRecord document;
};

}  // namespace passage_core
