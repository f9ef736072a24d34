#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>

#include "passage_api/config.hpp"
#include "passage_api/routes.hpp"
#include "passage_api/server.hpp"
#include "passage_core/db/chunk_store.hpp"
#include "passage_core/db/database_manager.hpp"
#include "passage_core/errors.hpp"
#include "passage_core/extractors/content_extractor_factory.hpp"
#include "passage_core/llm/ollama_client.hpp"
#include "passage_core/retrieval/retriever.hpp"
#include "passage_core/services/answer_service.hpp"
#include "passage_core/services/embedding_service.hpp"
#include "passage_core/services/ingestion_service.hpp"
#include "passage_core/services/question_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char **argv) {
  bool ingest_only = false;
  std::string config_path = "passagerc.json";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--ingest") == 0) {
      ingest_only = true;
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      std::cerr << "Usage: passage_api [--config <path>] [--ingest]" << std::endl;
      return 1;
    }
  }

  try {
    Config config = Config::from_file(config_path);

    std::cout << "Starting Passage..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Index Path: " << config.index_path << std::endl;
    std::cout << "Documents Directory: " << config.documents_directory << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: "
              << (config.generation_model.empty() ? "(none)" : config.generation_model)
              << std::endl;

    auto ollama_client = std::make_shared<passage_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model);
    auto &db_manager = passage_core::DatabaseManager::get_instance();
    db_manager.initialize(config.database_path, config.db_pool_size);

    auto chunk_store = std::make_shared<passage_core::ChunkStore>(db_manager);
    auto extractor_factory = std::make_shared<passage_core::ContentExtractorFactory>();
    auto embedding_service = std::make_shared<passage_core::EmbeddingService>(
        ollama_client, static_cast<size_t>(config.embedding_batch_size));
    passage_core::Chunker chunker(config.chunk_window_words, config.chunk_overlap_words,
                                  static_cast<size_t>(config.min_chunk_chars));
    auto retrieval_context = std::make_shared<passage_core::RetrievalContext>(
        embedding_service, chunk_store, config.index_path);
    auto ingestion_service = std::make_shared<passage_core::IngestionService>(
        chunk_store, extractor_factory, embedding_service, chunker,
        passage_core::IngestionOptions{config.documents_directory, config.index_path},
        retrieval_context);

    if (ingest_only) {
      passage_core::IngestionReport report = ingestion_service->ingest();
      std::cout << "Ingestion complete: " << report.documents_indexed << " documents, "
                << report.chunks_indexed << " chunks, dimension " << report.dimension
                << std::endl;
      for (const auto &skipped : report.documents_skipped) {
        std::cout << "  skipped: " << skipped << std::endl;
      }
      db_manager.shutdown();
      return 0;
    }

    auto retriever = std::make_shared<passage_core::Retriever>(retrieval_context);
    auto answer_service = std::make_shared<passage_core::AnswerService>(ollama_client);
    auto question_service = std::make_shared<passage_core::QuestionService>(
        retriever, answer_service, std::chrono::milliseconds(config.retrieval_timeout_ms),
        static_cast<size_t>(config.max_context_chars));

    passage_api::Server server(passage_api::parse_listen_address(config.api_base_url));
    passage_api::Routes routes(retriever, question_service, ingestion_service, retrieval_context,
                               chunk_store, config.default_top_k,
                               static_cast<size_t>(config.max_context_chars));
    routes.register_routes(server);

    // Load the index up front when there is one; otherwise queries fall back
    if (retrieval_context->index_exists()) {
      try {
        retrieval_context->ensure_initialized();
      } catch (const passage_core::PassageError &e) {
        std::cerr << "Warning: retrieval not ready: " << e.what() << std::endl;
      } catch (const passage_core::OllamaError &e) {
        std::cerr << "Warning: embedding model not ready: " << e.what() << std::endl;
      }
    } else {
      std::cout << "No vector index yet. Run ingestion to enable retrieval." << std::endl;
    }

    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Waiting for abandoned searches to finish..." << std::endl;
    if (!question_service->wait_for_idle(
            std::chrono::milliseconds(config.retrieval_timeout_ms))) {
      std::cerr << "Warning: " << question_service->searches_in_flight()
                << " searches still running at shutdown" << std::endl;
    }

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const passage_core::EmptyCorpusError &e) {
    std::cerr << "Nothing to index: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
