#pragma once

#include <string>

namespace passage_core {

// Raw nearest-neighbour hit: squared L2 distance to the vector in slot_id
struct SearchHit {
  int slot_id;
  float distance;
};

struct RetrievalResult {
  int slot_id = -1;
  std::string document;        // filename
  std::string document_title;  // may be empty
  int page = 0;
  std::string text;
  float score = 0.0f;  // squared L2 distance, lower is closer
  int rank = 0;        // 1-based
};

// Short form of a result for display next to an answer
struct SourceSummary {
  std::string document;
  int page = 0;
  std::string text;
  float score = 0.0f;
};

}  // namespace passage_core
