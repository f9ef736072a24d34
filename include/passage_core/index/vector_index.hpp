#pragma once

#include <faiss/IndexFlat.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "passage_core/types/retrieval.hpp"

namespace passage_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class VectorIndex
 * @brief Exact squared-L2 nearest-neighbour search over a fixed set of vectors.
 *
 * The vector at position i is slot i. Slots are never reassigned; the index is
 * rebuilt from scratch on every ingestion. Ties in distance are broken by the
 * lower slot so results are deterministic.
 */
class VectorIndex {
 public:
  // @throw EmptyCorpusError if vectors is empty
  // @throw DimensionMismatchError if the vectors do not all share one dimension
  static VectorIndex build(const std::vector<std::vector<float>> &vectors);

  // @throw IndexNotFoundError if nothing exists at path
  // @throw VectorIndexError if the file cannot be read or is not a flat L2 index
  static VectorIndex load(const std::filesystem::path &path);

  VectorIndex(VectorIndex &&) noexcept = default;
  VectorIndex &operator=(VectorIndex &&) noexcept = default;
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Up to min(k, size()) hits ordered by ascending distance. k <= 0 returns none.
  // @throw DimensionMismatchError if query.size() != dimension()
  std::vector<SearchHit> search(const std::vector<float> &query, int k) const;

  // Writes to a sibling temporary file, then renames it over path
  void persist(const std::filesystem::path &path) const;

  size_t size() const;
  size_t dimension() const;

 private:
  explicit VectorIndex(std::unique_ptr<faiss::IndexFlatL2> index);

  std::unique_ptr<faiss::IndexFlatL2> index_;
};

}  // namespace passage_core
