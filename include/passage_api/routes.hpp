#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "passage_core/services/ingestion_service.hpp"
#include "passage_core/services/question_service.hpp"
#include "server.hpp"

namespace passage_api {

class Routes {
 public:
  Routes(std::shared_ptr<passage_core::Retriever> retriever,
         std::shared_ptr<passage_core::QuestionService> question_service,
         std::shared_ptr<passage_core::IngestionService> ingestion_service,
         std::shared_ptr<passage_core::RetrievalContext> retrieval_context,
         std::shared_ptr<passage_core::ChunkStore> chunk_store,
         int default_top_k,
         size_t max_context_chars);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_context(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_stats(const crow::request &req);

  // JSON views of core types
  static nlohmann::json to_json(const passage_core::RetrievalResult &result);
  static nlohmann::json to_json(const passage_core::SourceSummary &summary);
  static nlohmann::json to_json(const passage_core::DocumentRecord &document);
  static nlohmann::json to_json(const passage_core::IngestionReport &report);

 private:
  std::shared_ptr<passage_core::Retriever> retriever_;
  std::shared_ptr<passage_core::QuestionService> question_service_;
  std::shared_ptr<passage_core::IngestionService> ingestion_service_;
  std::shared_ptr<passage_core::RetrievalContext> retrieval_context_;
  std::shared_ptr<passage_core::ChunkStore> chunk_store_;
  int default_top_k_;
  size_t max_context_chars_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_query(const nlohmann::json &body);
  int extract_top_k(const nlohmann::json &body);
  // Maps core exceptions to HTTP status codes
  crow::response create_failure_response(const std::exception &e, const std::string &handler);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace passage_api
