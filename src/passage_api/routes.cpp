#include "passage_api/routes.hpp"

#include <iostream>

#include "passage_core/db/chunk_store.hpp"
#include "passage_core/errors.hpp"
#include "passage_core/retrieval/context_assembler.hpp"

namespace passage_api {

namespace {

// Raised for malformed request bodies; always a 400
class BadRequest : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace

Routes::Routes(std::shared_ptr<passage_core::Retriever> retriever,
               std::shared_ptr<passage_core::QuestionService> question_service,
               std::shared_ptr<passage_core::IngestionService> ingestion_service,
               std::shared_ptr<passage_core::RetrievalContext> retrieval_context,
               std::shared_ptr<passage_core::ChunkStore> chunk_store,
               int default_top_k,
               size_t max_context_chars)
    : retriever_(std::move(retriever)),
      question_service_(std::move(question_service)),
      ingestion_service_(std::move(ingestion_service)),
      retrieval_context_(std::move(retrieval_context)),
      chunk_store_(std::move(chunk_store)),
      default_top_k_(default_top_k),
      max_context_chars_(max_context_chars) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/context").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_context(req);
  });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Passage API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["index_ready"] = retrieval_context_->index_exists();
  return create_json_response(response);
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string query = extract_query(body);
    int top_k = extract_top_k(body);
    std::cout << "Search for: " << query << " with top_k: " << top_k << std::endl;

    auto results = retriever_->search(query, top_k);

    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &result : results) {
      results_json.push_back(to_json(result));
    }
    nlohmann::json response = create_success_response("Search completed");
    response["data"]["results"] = results_json;
    response["data"]["count"] = results_json.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_search");
  }
}

crow::response Routes::handle_context(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string query = extract_query(body);
    int top_k = extract_top_k(body);
    size_t max_chars = body.value("max_chars", max_context_chars_);

    auto results = retriever_->search(query, top_k);

    nlohmann::json sources = nlohmann::json::array();
    for (const auto &summary : passage_core::ContextAssembler::summarize_sources(results)) {
      sources.push_back(to_json(summary));
    }
    nlohmann::json response = create_success_response("Context assembled");
    response["data"]["context"] = passage_core::ContextAssembler::assemble(results, max_chars);
    response["data"]["sources"] = sources;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_context");
  }
}

crow::response Routes::handle_ask(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string query = extract_query(body);
    if (query.empty()) {
      throw BadRequest("query cannot be empty");
    }
    int top_k = extract_top_k(body);
    std::cout << "Question: " << query << std::endl;

    passage_core::AnswerResult result = question_service_->ask(query, top_k);

    nlohmann::json sources = nlohmann::json::array();
    for (const auto &summary : result.sources) {
      sources.push_back(to_json(summary));
    }
    nlohmann::json response = create_success_response("Answer generated");
    response["data"]["answer"] = result.answer;
    response["data"]["mode"] = passage_core::to_string(result.mode);
    response["data"]["sources"] = sources;
    response["data"]["context"] = result.context;
    if (result.retrieval_error) {
      response["data"]["retrieval_error"] = *result.retrieval_error;
    }
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_ask");
  }
}

crow::response Routes::handle_ingest(const crow::request &) {
  try {
    std::cout << "Ingestion requested" << std::endl;
    // The ingestion service installs the new index into the live context
    passage_core::IngestionReport report = ingestion_service_->ingest();

    nlohmann::json response = create_success_response("Ingestion completed");
    response["data"] = to_json(report);
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_ingest");
  }
}

crow::response Routes::handle_list_documents(const crow::request &) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : chunk_store_->list_documents()) {
      documents.push_back(to_json(document));
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_list_documents");
  }
}

crow::response Routes::handle_stats(const crow::request &) {
  try {
    nlohmann::json data;
    data["documents"] = chunk_store_->document_count();
    data["chunks"] = chunk_store_->chunk_count();
    data["index_exists"] = retrieval_context_->index_exists();
    if (auto info = chunk_store_->index_info()) {
      data["index"]["embedding_model"] = info->embedding_model;
      data["index"]["dimension"] = info->dimension;
      data["index"]["vector_count"] = info->vector_count;
      data["index"]["built_at"] = passage_core::ChunkStore::time_point_to_string(info->built_at);
    } else {
      data["index"] = nullptr;
    }
    nlohmann::json response = create_success_response("Stats retrieved successfully");
    response["data"] = data;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_failure_response(e, "handle_stats");
  }
}

nlohmann::json Routes::to_json(const passage_core::RetrievalResult &result) {
  nlohmann::json json;
  json["slot_id"] = result.slot_id;
  json["document"] = result.document;
  json["document_title"] = result.document_title;
  json["page"] = result.page;
  json["text"] = result.text;
  json["score"] = result.score;
  json["rank"] = result.rank;
  return json;
}

nlohmann::json Routes::to_json(const passage_core::SourceSummary &summary) {
  nlohmann::json json;
  json["document"] = summary.document;
  json["page"] = summary.page;
  json["text"] = summary.text;
  json["score"] = summary.score;
  return json;
}

nlohmann::json Routes::to_json(const passage_core::DocumentRecord &document) {
  nlohmann::json json;
  json["id"] = document.id;
  json["filename"] = document.filename;
  json["title"] = document.title;
  json["type"] = passage_core::to_string(document.document_type);
  json["size"] = document.file_size;
  json["pages"] = document.page_count;
  json["content_hash"] = document.content_hash;
  json["ingested_at"] = passage_core::ChunkStore::time_point_to_string(document.ingested_at);
  return json;
}

nlohmann::json Routes::to_json(const passage_core::IngestionReport &report) {
  nlohmann::json json;
  json["documents_scanned"] = report.documents_scanned;
  json["documents_indexed"] = report.documents_indexed;
  json["documents_carried_over"] = report.documents_carried_over;
  json["documents_skipped"] = report.documents_skipped;
  json["chunks_indexed"] = report.chunks_indexed;
  json["dimension"] = report.dimension;
  json["index_path"] = report.index_path.string();
  return json;
}

crow::response Routes::create_failure_response(const std::exception &e,
                                               const std::string &handler) {
  int status = 500;
  if (dynamic_cast<const BadRequest *>(&e) || dynamic_cast<const nlohmann::json::exception *>(&e)) {
    status = 400;
  } else if (dynamic_cast<const passage_core::IndexNotFoundError *>(&e)) {
    status = 404;
  } else if (dynamic_cast<const passage_core::IngestionInProgressError *>(&e)) {
    status = 409;
  } else if (dynamic_cast<const passage_core::EmptyCorpusError *>(&e)) {
    status = 422;
  } else if (dynamic_cast<const passage_core::RetrievalError *>(&e)) {
    status = 503;
  } else if (const auto *store_error = dynamic_cast<const passage_core::ChunkStoreError *>(&e)) {
    status = store_error->is_transient() ? 503 : 500;
  }
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  return create_json_response(create_error_response(e.what()), status);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto json = nlohmann::json::parse(body);
  if (!json.is_object()) {
    throw BadRequest("Request body must be a JSON object");
  }
  return json;
}

std::string Routes::extract_query(const nlohmann::json &body) {
  return body.value("query", "");
}

int Routes::extract_top_k(const nlohmann::json &body) {
  return body.value("top_k", default_top_k_);
}

}  // namespace passage_api
