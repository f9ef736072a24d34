#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "passage_core/db/pooled_connection.hpp"

namespace passage_core {

class DatabaseManagerTest : public passage_tests::ChunkStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"documents", "chunks", "index_meta"};

  PooledConnection conn(*db_manager_);
  for (const auto &table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name='idx_chunks_document'" >>
      idx_count;
  EXPECT_EQ(idx_count, 1);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, DeletingDocumentCascadesToChunks) {
  PooledConnection conn(*db_manager_);
  *conn << "INSERT INTO documents (filename, title, content_hash, document_type, file_size, "
           "page_count, ingested_at) VALUES ('a.txt', 'a', 'h', 'text', 1, 1, "
           "'2024-01-01 00:00:00')";
  int document_id = static_cast<int>(conn->last_insert_rowid());
  *conn << "INSERT INTO chunks (slot_id, document_id, page_number, content) VALUES (0, ?, 1, 'x')"
        << document_id;

  *conn << "DELETE FROM documents WHERE id = ?" << document_id;

  int remaining = -1;
  *conn << "SELECT COUNT(*) FROM chunks" >> remaining;
  EXPECT_EQ(remaining, 0);
}

TEST_F(DatabaseManagerTest, IndexMetaHoldsSingleRow) {
  PooledConnection conn(*db_manager_);
  EXPECT_THROW(*conn << "INSERT INTO index_meta (id, embedding_model, dimension, vector_count, "
                        "built_at) VALUES (2, 'm', 8, 1, '2024-01-01 00:00:00')",
               sqlite::sqlite_exception);
}

TEST_F(DatabaseManagerTest, WriteTransactionRollsBackWithoutCommit) {
  {
    WriteTransaction tx(*db_manager_);
    *tx << "INSERT INTO documents (filename, title, content_hash, document_type, file_size, "
           "page_count, ingested_at) VALUES ('a.txt', 'a', 'h', 'text', 1, 1, "
           "'2024-01-01 00:00:00')";
  }

  PooledConnection conn(*db_manager_);
  int count = -1;
  *conn << "SELECT COUNT(*) FROM documents" >> count;
  EXPECT_EQ(count, 0);
}

TEST_F(DatabaseManagerTest, WriteTransactionCommitIsVisibleToOtherConnections) {
  {
    WriteTransaction tx(*db_manager_);
    *tx << "INSERT INTO documents (filename, title, content_hash, document_type, file_size, "
           "page_count, ingested_at) VALUES ('a.txt', 'a', 'h', 'text', 1, 1, "
           "'2024-01-01 00:00:00')";
    tx.commit();
  }

  PooledConnection conn(*db_manager_);
  int count = -1;
  *conn << "SELECT COUNT(*) FROM documents" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, InitializeTwiceIsNoOp) {
  EXPECT_NO_THROW(db_manager_->initialize(temp_db_path_, 4));
  EXPECT_TRUE(db_manager_->is_initialized());
}

TEST_F(DatabaseManagerTest, ConnectionAfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_initialized());
  EXPECT_THROW(db_manager_->pool(), std::runtime_error);
  EXPECT_THROW(PooledConnection conn(*db_manager_), std::runtime_error);
}

TEST_F(DatabaseManagerTest, ConnectionHeldAcrossShutdownStaysUsable) {
  auto held = std::make_unique<PooledConnection>(*db_manager_);
  db_manager_->shutdown();

  int count = 0;
  *(*held) << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);

  // A fresh database must not receive the connection released from the old pool
  auto other_db = passage_tests::TestUtilities::create_temp_test_db();
  db_manager_->initialize(other_db, 1);
  EXPECT_NO_THROW(held.reset());

  PooledConnection conn(*db_manager_);
  std::string file;
  *conn << "SELECT file FROM pragma_database_list WHERE name = 'main'" >> file;
  EXPECT_EQ(std::filesystem::path(file).filename(), other_db.filename());

  db_manager_->shutdown();
  passage_tests::TestUtilities::cleanup_temp_db(other_db);
}

TEST_F(DatabaseManagerTest, ShutdownRacesWithBorrowers) {
  std::atomic<int> borrowed{0};
  std::atomic<int> refused{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < 50; ++j) {
        try {
          PooledConnection conn(*db_manager_);
          int count = 0;
          *conn << "SELECT COUNT(*) FROM documents" >> count;
          ++borrowed;
        } catch (const std::runtime_error &) {
          ++refused;
        }
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  db_manager_->shutdown();
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(borrowed.load() + refused.load(), 8 * 50);
  EXPECT_FALSE(db_manager_->is_initialized());
}

}  // namespace passage_core
