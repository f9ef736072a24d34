#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <memory>
#include <stdexcept>

#include "passage_core/db/database_manager.hpp"

namespace passage_core {

// Borrows a connection from the manager's pool for the guard's lifetime
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : pool_(manager.pool()), conn_(pool_->get_connection()) {
    if (!conn_) {
      throw std::runtime_error("No database connection available: the store is shutting down.");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      pool_->return_connection(std::move(conn_));
    }
  }

  sqlite::database* operator->() const { return conn_.get(); }
  sqlite::database& operator*() const { return *conn_; }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

 private:
  std::shared_ptr<ConnectionPool> pool_;
  std::unique_ptr<sqlite::database> conn_;
};

// A pooled connection holding the database write lock. BEGIN IMMEDIATE is taken
// up front so a publish never upgrades from a read lock halfway through; WAL
// readers keep seeing the previous snapshot until commit(). Rolls back when
// destroyed without commit().
class WriteTransaction {
 public:
  explicit WriteTransaction(DatabaseManager& manager) : conn_(manager) {
    *conn_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  ~WriteTransaction() {
    if (!open_) {
      return;
    }
    try {
      *conn_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[ChunkStore] Rollback failed: " << e.what() << std::endl;
    }
  }

  void commit() {
    if (open_) {
      *conn_ << "COMMIT;";
      open_ = false;
    }
  }

  sqlite::database* operator->() const { return conn_.operator->(); }
  sqlite::database& operator*() const { return *conn_; }

  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

 private:
  PooledConnection conn_;
  bool open_ = false;
};

}  // namespace passage_core
