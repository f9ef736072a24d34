#include "passage_core/db/chunk_store.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "passage_core/db/pooled_connection.hpp"
#include "passage_core/errors.hpp"
#include "passage_core/services/compression_service.hpp"

namespace passage_core {

namespace {

const char *const DOCUMENT_COLUMNS =
    "id, filename, title, content_hash, document_type, file_size, page_count, ingested_at";

DocumentRecord make_document(int id,
                             std::string filename,
                             std::string title,
                             std::string content_hash,
                             const std::string &document_type,
                             int64_t file_size,
                             int page_count,
                             const std::string &ingested_at) {
  DocumentRecord document;
  document.id = id;
  document.filename = std::move(filename);
  document.title = std::move(title);
  document.content_hash = std::move(content_hash);
  document.document_type = document_type_from_string(document_type);
  document.file_size = static_cast<size_t>(file_size);
  document.page_count = page_count;
  document.ingested_at = ChunkStore::string_to_time_point(ingested_at);
  return document;
}

}  // namespace

std::string ChunkStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point ChunkStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw ChunkStoreError("Failed to parse time string: " + time_str +
                          ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string ChunkStore::int_vector_to_comma_string(const std::vector<int> &ids) {
  std::string result;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      result += ",";
    }
    result += std::to_string(ids[i]);
  }
  return result;
}

ChunkStore::ChunkStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void ChunkStore::commit_run(const IngestionRun &run, const IndexInfo &info) {
  const auto &chunks = run.chunks();
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].slot_id != static_cast<int>(i)) {
      throw SlotCorrelationError("Staged chunk " + std::to_string(i) + " has slot " +
                                 std::to_string(chunks[i].slot_id));
    }
  }
  if (info.vector_count != run.size()) {
    throw SlotCorrelationError("Index holds " + std::to_string(info.vector_count) +
                               " vectors but " + std::to_string(run.size()) +
                               " chunks were staged");
  }

  // Compress before taking the write lock
  std::vector<std::vector<char>> compressed;
  compressed.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    compressed.push_back(CompressionService::compress(chunk.text));
  }

  try {
    WriteTransaction conn(db_manager_);

    std::vector<int> document_ids;
    document_ids.reserve(run.documents().size());
    for (const auto &document : run.documents()) {
      int existing_id = -1;
      *conn << "SELECT id FROM documents WHERE filename = ?" << document.filename >>
          [&](int id) { existing_id = id; };

      const std::string ingested_at = time_point_to_string(document.ingested_at);
      if (existing_id != -1) {
        *conn << "UPDATE documents SET title=?, content_hash=?, document_type=?, file_size=?, "
                 "page_count=?, ingested_at=? WHERE id=?"
              << document.title << document.content_hash << to_string(document.document_type)
              << static_cast<int64_t>(document.file_size) << document.page_count << ingested_at
              << existing_id;
        document_ids.push_back(existing_id);
      } else {
        *conn << "INSERT INTO documents (filename, title, content_hash, document_type, file_size, "
                 "page_count, ingested_at) VALUES (?,?,?,?,?,?,?)"
              << document.filename << document.title << document.content_hash
              << to_string(document.document_type) << static_cast<int64_t>(document.file_size)
              << document.page_count << ingested_at;
        document_ids.push_back(static_cast<int>(conn->last_insert_rowid()));
      }
    }

    *conn << "DELETE FROM chunks;";
    for (size_t i = 0; i < chunks.size(); ++i) {
      *conn << "INSERT INTO chunks (slot_id, document_id, page_number, content) VALUES (?,?,?,?)"
            << chunks[i].slot_id << document_ids.at(chunks[i].staged_document)
            << chunks[i].page_number << compressed[i];
    }

    if (document_ids.empty()) {
      *conn << "DELETE FROM documents;";
    } else {
      *conn << "DELETE FROM documents WHERE id NOT IN (" +
                   int_vector_to_comma_string(document_ids) + ")";
    }

    *conn << "REPLACE INTO index_meta (id, embedding_model, dimension, vector_count, built_at) "
             "VALUES (1, ?, ?, ?, ?)"
          << info.embedding_model << static_cast<int64_t>(info.dimension)
          << static_cast<int64_t>(info.vector_count) << time_point_to_string(info.built_at);

    conn.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("commit_run", e);
  }

  std::cout << "[ChunkStore] Committed " << chunks.size() << " chunks from "
            << run.documents().size() << " documents" << std::endl;
}

std::optional<StoredChunk> ChunkStore::get_by_slot(int slot_id) {
  auto found = get_by_slots({slot_id});
  auto it = found.find(slot_id);
  if (it == found.end()) {
    return std::nullopt;
  }
  return std::move(it->second);
}

std::map<int, StoredChunk> ChunkStore::get_by_slots(const std::vector<int> &slot_ids) {
  std::map<int, StoredChunk> result;
  if (slot_ids.empty()) {
    return result;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.slot_id, c.document_id, c.page_number, c.content, d.filename, d.title, "
             "d.content_hash, d.document_type, d.file_size, d.page_count, d.ingested_at "
             "FROM chunks c JOIN documents d ON d.id = c.document_id WHERE c.slot_id IN (" +
                 int_vector_to_comma_string(slot_ids) + ")" >>
        [&](int slot_id, int document_id, int page_number, std::vector<char> content,
            std::string filename, std::string title, std::string content_hash,
            std::string document_type, int64_t file_size, int page_count,
            std::string ingested_at) {
          StoredChunk stored;
          stored.chunk.slot_id = slot_id;
          stored.chunk.document_id = document_id;
          stored.chunk.page_number = page_number;
          stored.chunk.text = CompressionService::decompress(content);
          stored.document =
              make_document(document_id, std::move(filename), std::move(title),
                            std::move(content_hash), document_type, file_size, page_count,
                            ingested_at);
          result.emplace(slot_id, std::move(stored));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("get_by_slots", e);
  }
  return result;
}

std::vector<ChunkRecord> ChunkStore::get_chunks_for_document(const std::string &filename) {
  std::vector<ChunkRecord> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.slot_id, c.document_id, c.page_number, c.content FROM chunks c "
             "JOIN documents d ON d.id = c.document_id WHERE d.filename = ? ORDER BY c.slot_id"
          << filename >>
        [&](int slot_id, int document_id, int page_number, std::vector<char> content) {
          chunks.push_back(
              {slot_id, document_id, page_number, CompressionService::decompress(content)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("get_chunks_for_document", e);
  }
  return chunks;
}

std::optional<DocumentRecord> ChunkStore::get_document(const std::string &filename) {
  std::optional<DocumentRecord> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + DOCUMENT_COLUMNS + " FROM documents WHERE filename = ?"
          << filename >>
        [&](int id, std::string name, std::string title, std::string content_hash,
            std::string document_type, int64_t file_size, int page_count,
            std::string ingested_at) {
          result = make_document(id, std::move(name), std::move(title), std::move(content_hash),
                                 document_type, file_size, page_count, ingested_at);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("get_document", e);
  }
  return result;
}

std::vector<DocumentRecord> ChunkStore::list_documents() {
  std::vector<DocumentRecord> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + DOCUMENT_COLUMNS + " FROM documents ORDER BY filename" >>
        [&](int id, std::string name, std::string title, std::string content_hash,
            std::string document_type, int64_t file_size, int page_count,
            std::string ingested_at) {
          documents.push_back(make_document(id, std::move(name), std::move(title),
                                            std::move(content_hash), document_type, file_size,
                                            page_count, ingested_at));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("list_documents", e);
  }
  return documents;
}

size_t ChunkStore::chunk_count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("chunk_count", e);
  }
}

size_t ChunkStore::document_count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("document_count", e);
  }
}

std::optional<IndexInfo> ChunkStore::index_info() {
  std::optional<IndexInfo> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT embedding_model, dimension, vector_count, built_at FROM index_meta "
             "WHERE id = 1" >>
        [&](std::string embedding_model, int64_t dimension, int64_t vector_count,
            std::string built_at) {
          IndexInfo info;
          info.embedding_model = std::move(embedding_model);
          info.dimension = static_cast<size_t>(dimension);
          info.vector_count = static_cast<size_t>(vector_count);
          info.built_at = string_to_time_point(built_at);
          result = std::move(info);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError::from_sqlite("index_info", e);
  }
  return result;
}

}  // namespace passage_core
