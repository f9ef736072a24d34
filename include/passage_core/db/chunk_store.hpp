#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "passage_core/db/database_manager.hpp"
#include "passage_core/db/sqlite_error_utils.hpp"
#include "passage_core/ingestion/ingestion_run.hpp"
#include "passage_core/types/chunk.hpp"
#include "passage_core/types/document.hpp"

namespace passage_core {

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string &message,
                           DbErrorKind kind = DbErrorKind::Generic)
      : message_(message), kind_(kind) {}

  // Wraps a failed statement, keeping SQLite's classification
  static ChunkStoreError from_sqlite(const std::string &operation,
                                     const sqlite::sqlite_exception &e) {
    return ChunkStoreError(describe_db_error(operation, e), classify_sqlite_code(e.get_code()));
  }

  const char *what() const noexcept override {
    return message_.c_str();
  }

  DbErrorKind kind() const {
    return kind_;
  }
  bool is_transient() const {
    return passage_core::is_transient(kind_);
  }

 private:
  std::string message_;
  DbErrorKind kind_;
};

// Describes the vector index the chunk table currently corresponds to
struct IndexInfo {
  std::string embedding_model;
  size_t dimension = 0;
  size_t vector_count = 0;
  std::chrono::system_clock::time_point built_at;
};

/**
 * @class ChunkStore
 * @brief Durable map from index slot to chunk text and source metadata.
 *
 * The chunk table is replaced wholesale on each ingestion. Slots form the
 * dense range [0, chunk_count()) and match the positions in the index
 * described by index_info().
 */
class ChunkStore {
 public:
  explicit ChunkStore(DatabaseManager &db_manager);
  virtual ~ChunkStore() = default;

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * @brief Replaces all chunks with the ones staged in run, in a single transaction.
   *
   * Documents in the run are upserted by filename; documents not in the run
   * are removed together with their chunks.
   *
   * @throw SlotCorrelationError if run slots are not 0..n-1 in order or
   *        info.vector_count differs from run.size(). Nothing is written.
   * @throw ChunkStoreError on database failure. Nothing is written.
   */
  virtual void commit_run(const IngestionRun &run, const IndexInfo &info);

  virtual std::optional<StoredChunk> get_by_slot(int slot_id);
  // Slots with no stored chunk are absent from the result
  virtual std::map<int, StoredChunk> get_by_slots(const std::vector<int> &slot_ids);

  // Ordered by slot
  std::vector<ChunkRecord> get_chunks_for_document(const std::string &filename);
  std::optional<DocumentRecord> get_document(const std::string &filename);
  std::vector<DocumentRecord> list_documents();

  virtual size_t chunk_count();
  size_t document_count();
  std::optional<IndexInfo> index_info();

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  static std::string int_vector_to_comma_string(const std::vector<int> &ids);

  DatabaseManager &db_manager_;
};

}  // namespace passage_core
