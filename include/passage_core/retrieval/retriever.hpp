#pragma once

#include <memory>
#include <string>
#include <vector>

#include "passage_core/retrieval/retrieval_context.hpp"
#include "passage_core/types/retrieval.hpp"

namespace passage_core {

/**
 * @class Retriever
 * @brief Finds the chunks nearest to a query.
 *
 * Results are ordered by ascending distance with ties broken by slot and
 * carry 1-based ranks. An empty result means nothing matched; an unavailable
 * subsystem is reported by exception instead.
 */
class Retriever {
 public:
  static constexpr int DEFAULT_TOP_K = 5;

  explicit Retriever(std::shared_ptr<RetrievalContext> context);
  virtual ~Retriever() = default;

  // Empty query or top_k <= 0 returns no results without touching the index.
  // @throw IndexNotFoundError if no index has been persisted
  // @throw RetrievalError if the embedding model is unreachable or the query cannot be embedded
  // @throw DimensionMismatchError if the embedder and index disagree
  virtual std::vector<RetrievalResult> search(const std::string &query,
                                              int top_k = DEFAULT_TOP_K);

 private:
  std::shared_ptr<RetrievalContext> context_;
};

}  // namespace passage_core
