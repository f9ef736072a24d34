#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "passage_core/chunking/chunker.hpp"
#include "passage_core/db/chunk_store.hpp"
#include "passage_core/extractors/content_extractor_factory.hpp"
#include "passage_core/ingestion/ingestion_run.hpp"
#include "passage_core/retrieval/retrieval_context.hpp"
#include "passage_core/services/embedding_service.hpp"

namespace passage_core {

struct IngestionOptions {
  std::filesystem::path documents_directory;
  std::filesystem::path index_path;
};

struct IngestionReport {
  size_t documents_scanned = 0;
  size_t documents_indexed = 0;
  // Documents whose extraction produced nothing and whose earlier chunks were kept
  size_t documents_carried_over = 0;
  // Documents that produced no chunks at all
  std::vector<std::string> documents_skipped;
  size_t chunks_indexed = 0;
  size_t dimension = 0;
  std::filesystem::path index_path;
};

/**
 * @class IngestionService
 * @brief Rebuilds the vector index and chunk store from the documents directory.
 *
 * A run extracts, chunks and embeds every supported file, builds a fresh
 * index, and only then replaces the persisted index and chunk rows. Any
 * failure before that point leaves the previous index and rows in place.
 * When a retrieval context is attached, the new index is installed into it
 * under its swap guard in the same step as the commit.
 */
class IngestionService {
 public:
  IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   std::shared_ptr<EmbeddingService> embedding_service,
                   Chunker chunker,
                   IngestionOptions options,
                   std::shared_ptr<RetrievalContext> retrieval_context = nullptr);

  IngestionService(const IngestionService &) = delete;
  IngestionService &operator=(const IngestionService &) = delete;

  // @throw IngestionInProgressError if another run is active
  // @throw EmptyCorpusError if no chunk could be produced
  IngestionReport ingest();

  // Supported files directly inside the documents directory, sorted by filename
  std::vector<std::filesystem::path> scan_documents() const;

  bool is_running() const { return running_.load(); }

 private:
  // Stages one file into run. Returns the number of chunks staged.
  size_t stage_document(IngestionRun &run,
                        const std::filesystem::path &file_path,
                        IngestionReport &report);

  std::vector<PageText> extract_pages_safely(const ContentExtractor &extractor,
                                             const std::filesystem::path &file_path) const;

  void publish(const IngestionRun &run, const std::vector<std::vector<float>> &vectors,
               IngestionReport &report);

  // Puts the backed-up index file back after a failed commit
  void restore_index_file(bool had_previous, const std::filesystem::path &backup_path) const;

  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<EmbeddingService> embedding_service_;
  Chunker chunker_;
  IngestionOptions options_;
  std::shared_ptr<RetrievalContext> retrieval_context_;

  std::atomic<bool> running_{false};
};

}  // namespace passage_core
