#include "passage_core/db/database_manager.hpp"

#include <stdexcept>

namespace passage_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pool_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on its own connection, so pooled connections see the tables
  setup_schema(db_path);
  pool_ = std::make_shared<ConnectionPool>(db_path.string(), pool_size);
}

void DatabaseManager::shutdown() {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool.swap(pool_);
  }
  if (pool) {
    // Wakes any borrower blocked on an empty pool
    pool->shutdown();
  }
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_ != nullptr;
}

std::shared_ptr<ConnectionPool> DatabaseManager::pool() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pool_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_;
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  if (!db.connection()) {
    throw std::runtime_error("Setup: Failed to open database " + db_path.string());
  }
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          filename TEXT UNIQUE NOT NULL,
          title TEXT,
          content_hash TEXT NOT NULL,
          document_type TEXT NOT NULL,
          file_size INTEGER NOT NULL,
          page_count INTEGER NOT NULL,
          ingested_at TEXT NOT NULL
      )
    )";

  // slot_id is the position of the chunk's vector in the persisted index
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          slot_id INTEGER PRIMARY KEY,
          document_id INTEGER NOT NULL,
          page_number INTEGER NOT NULL,
          content BLOB NOT NULL,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_document
      ON chunks(document_id, slot_id)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS index_meta (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          embedding_model TEXT NOT NULL,
          dimension INTEGER NOT NULL,
          vector_count INTEGER NOT NULL,
          built_at TEXT NOT NULL
      )
    )";
}

}  // namespace passage_core
