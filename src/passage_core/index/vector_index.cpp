#include "passage_core/index/vector_index.hpp"

#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <iostream>

#include "passage_core/errors.hpp"

namespace passage_core {

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexFlatL2> index) : index_(std::move(index)) {}

VectorIndex VectorIndex::build(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    throw EmptyCorpusError("Cannot build a vector index from zero vectors");
  }
  const size_t dimension = vectors.front().size();
  if (dimension == 0) {
    throw VectorIndexError("Cannot build a vector index from zero-length vectors");
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension);
  for (const auto &vector : vectors) {
    if (vector.size() != dimension) {
      throw DimensionMismatchError(dimension, vector.size(), "Vector index build");
    }
    flat.insert(flat.end(), vector.begin(), vector.end());
  }

  auto index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension));
  index->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  return VectorIndex(std::move(index));
}

VectorIndex VectorIndex::load(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw IndexNotFoundError("No vector index at " + path.string() + ". Re-run ingestion.");
  }

  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(path.string().c_str()));
  } catch (const std::exception &e) {
    throw VectorIndexError("Failed to read vector index " + path.string() + ": " + e.what());
  }

  auto *flat = dynamic_cast<faiss::IndexFlatL2 *>(loaded.get());
  if (!flat) {
    throw VectorIndexError("Vector index " + path.string() + " is not a flat L2 index");
  }
  loaded.release();
  return VectorIndex(std::unique_ptr<faiss::IndexFlatL2>(flat));
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (query.size() != dimension()) {
    throw DimensionMismatchError(dimension(), query.size(), "Vector index search");
  }
  if (k <= 0 || size() == 0) {
    return {};
  }

  // faiss::IndexFlat::search does not promise an order among equal distances,
  // so distances to every slot are computed and sorted here.
  const size_t n = size();
  std::vector<float> distances(n);
  faiss::fvec_L2sqr_ny(distances.data(), query.data(), index_->get_xb(), dimension(), n);

  std::vector<SearchHit> hits;
  hits.reserve(n);
  for (size_t slot = 0; slot < n; ++slot) {
    hits.push_back({static_cast<int>(slot), distances[slot]});
  }

  const size_t count = std::min(static_cast<size_t>(k), n);
  std::partial_sort(hits.begin(), hits.begin() + count, hits.end(),
                    [](const SearchHit &a, const SearchHit &b) {
                      if (a.distance != b.distance) {
                        return a.distance < b.distance;
                      }
                      return a.slot_id < b.slot_id;
                    });
  hits.resize(count);
  return hits;
}

void VectorIndex::persist(const std::filesystem::path &path) const {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  try {
    faiss::write_index(index_.get(), tmp_path.string().c_str());
  } catch (const std::exception &e) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw VectorIndexError("Failed to write vector index " + tmp_path.string() + ": " + e.what());
  }
  std::filesystem::rename(tmp_path, path);
  std::cout << "[VectorIndex] Saved " << size() << " vectors to " << path.string() << std::endl;
}

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

size_t VectorIndex::dimension() const {
  return static_cast<size_t>(index_->d);
}

}  // namespace passage_core
