#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "passage_core/db/connection_pool.hpp"

namespace passage_core {

class DatabaseManager {
 public:
  // Singleton access
  static DatabaseManager& get_instance();

  // Must be called once at application startup. Creates the parent directory
  // and the schema if they do not exist yet.
  void initialize(const std::filesystem::path& db_path, int pool_size);

  // The live pool, shared so a borrower that races with shutdown() returns its
  // connection to the pool it came from, which then closes it.
  // @throw std::runtime_error if not initialized
  std::shared_ptr<ConnectionPool> pool() const;

  void shutdown();
  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path);

  mutable std::mutex mutex_;
  std::shared_ptr<ConnectionPool> pool_;
};

}  // namespace passage_core
