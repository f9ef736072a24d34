#include "passage_core/db/connection_pool.hpp"

#include <stdexcept>

namespace passage_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string& db_path) {
  auto db = std::make_unique<sqlite::database>(db_path);
  if (!db->connection()) {
    throw std::runtime_error("Failed to open pooled connection to " + db_path);
  }
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size) : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_connection(db_path_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!shutting_down_) {
      pool_.push(std::move(conn));
    }
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    while (!pool_.empty()) {
      pool_.pop();
    }
  }
  cv_.notify_all();
}

}  // namespace passage_core
