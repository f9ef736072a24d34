#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace passage_core {

// Fixed set of open connections handed out one caller at a time
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

 private:
  static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path);

  bool shutting_down_ = false;
  std::string db_path_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace passage_core
