#include "passage_core/services/ingestion_service.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <shared_mutex>

#include "passage_core/errors.hpp"
#include "passage_core/index/vector_index.hpp"

namespace passage_core {

namespace {

// Resets the running flag on every exit path
class RunGuard {
 public:
  explicit RunGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~RunGuard() { flag_.store(false); }

  RunGuard(const RunGuard &) = delete;
  RunGuard &operator=(const RunGuard &) = delete;

 private:
  std::atomic<bool> &flag_;
};

}  // namespace

IngestionService::IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                   std::shared_ptr<EmbeddingService> embedding_service,
                                   Chunker chunker,
                                   IngestionOptions options,
                                   std::shared_ptr<RetrievalContext> retrieval_context)
    : chunk_store_(std::move(chunk_store)),
      extractor_factory_(std::move(extractor_factory)),
      embedding_service_(std::move(embedding_service)),
      chunker_(std::move(chunker)),
      options_(std::move(options)),
      retrieval_context_(std::move(retrieval_context)) {}

std::vector<std::filesystem::path> IngestionService::scan_documents() const {
  std::vector<std::filesystem::path> files;
  if (!std::filesystem::is_directory(options_.documents_directory)) {
    std::cerr << "Warning: documents directory " << options_.documents_directory.string()
              << " does not exist" << std::endl;
    return files;
  }

  for (const auto &entry : std::filesystem::directory_iterator(options_.documents_directory)) {
    if (entry.is_regular_file() && extractor_factory_->is_supported(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end(),
            [](const std::filesystem::path &a, const std::filesystem::path &b) {
              return a.filename().string() < b.filename().string();
            });
  return files;
}

IngestionReport IngestionService::ingest() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    throw IngestionInProgressError("An ingestion run is already in progress");
  }
  RunGuard guard(running_);

  IngestionReport report;
  report.index_path = options_.index_path;

  std::cout << "[Ingestion] Scanning " << options_.documents_directory.string() << std::endl;
  const auto files = scan_documents();
  report.documents_scanned = files.size();

  IngestionRun run;
  for (const auto &file_path : files) {
    stage_document(run, file_path, report);
  }

  if (run.empty()) {
    throw EmptyCorpusError("Nothing to index: no chunks could be produced from " +
                           options_.documents_directory.string());
  }

  std::cout << "[Ingestion] Embedding " << run.size() << " chunks" << std::endl;
  std::vector<std::vector<float>> vectors = embedding_service_->embed(run.texts());

  publish(run, vectors, report);

  std::cout << "[Ingestion] Indexed " << report.chunks_indexed << " chunks from "
            << report.documents_indexed << " documents" << std::endl;
  return report;
}

size_t IngestionService::stage_document(IngestionRun &run,
                                        const std::filesystem::path &file_path,
                                        IngestionReport &report) {
  const std::string filename = file_path.filename().string();
  std::cout << "[Ingestion] Processing " << filename << std::endl;

  const ContentExtractor &extractor = extractor_factory_->get_extractor_for(file_path);
  std::vector<PageText> pages = extract_pages_safely(extractor, file_path);

  if (pages.empty()) {
    // Keep what an earlier run indexed rather than dropping the document
    std::optional<DocumentRecord> prior = chunk_store_->get_document(filename);
    if (prior) {
      std::vector<ChunkRecord> prior_chunks = chunk_store_->get_chunks_for_document(filename);
      if (!prior_chunks.empty()) {
        const size_t staged = run.add_document(*prior);
        const size_t count = run.carry_over(staged, prior_chunks);
        std::cerr << "Warning: no text extracted from " << filename << ", keeping " << count
                  << " previously indexed chunks" << std::endl;
        ++report.documents_carried_over;
        ++report.documents_indexed;
        return count;
      }
    }
    std::cerr << "Warning: no text extracted from " << filename << ", skipping" << std::endl;
    report.documents_skipped.push_back(filename);
    return 0;
  }

  std::vector<std::pair<int, std::string>> chunks;
  for (const auto &page : pages) {
    for (auto &text : chunker_.chunk(page.text)) {
      chunks.emplace_back(page.page_number, std::move(text));
    }
  }
  if (chunks.empty()) {
    std::cerr << "Warning: " << filename << " produced no chunks, skipping" << std::endl;
    report.documents_skipped.push_back(filename);
    return 0;
  }

  DocumentRecord document;
  document.filename = filename;
  document.title = title_from_filename(filename);
  try {
    document.content_hash = extractor.get_content_hash(file_path);
    document.file_size = std::filesystem::file_size(file_path);
  } catch (const std::exception &e) {
    std::cerr << "Warning: could not read " << filename << " after extraction, skipping: "
              << e.what() << std::endl;
    report.documents_skipped.push_back(filename);
    return 0;
  }
  document.document_type = extractor.get_document_type();
  document.page_count = static_cast<int>(pages.size());
  document.ingested_at = std::chrono::system_clock::now();

  const size_t staged = run.add_document(std::move(document));
  for (auto &[page_number, text] : chunks) {
    run.insert(staged, page_number, std::move(text));
  }
  ++report.documents_indexed;
  return chunks.size();
}

std::vector<PageText> IngestionService::extract_pages_safely(
    const ContentExtractor &extractor, const std::filesystem::path &file_path) const {
  try {
    return extractor.extract_pages(file_path);
  } catch (const std::exception &e) {
    std::cerr << "[Ingestion] Extraction failed for " << file_path.string() << ": " << e.what()
              << std::endl;
    return {};
  }
}

void IngestionService::publish(const IngestionRun &run,
                               const std::vector<std::vector<float>> &vectors,
                               IngestionReport &report) {
  if (vectors.size() != run.size()) {
    throw SlotCorrelationError("Embedded " + std::to_string(vectors.size()) + " vectors for " +
                               std::to_string(run.size()) + " chunks");
  }

  VectorIndex index = VectorIndex::build(vectors);
  if (index.size() != run.size()) {
    throw SlotCorrelationError("Index holds " + std::to_string(index.size()) + " vectors but " +
                               std::to_string(run.size()) + " chunks were staged");
  }
  const size_t dimension = embedding_service_->dimension();
  if (index.dimension() != dimension) {
    throw DimensionMismatchError(dimension, index.dimension(), "Ingestion");
  }

  std::filesystem::path staging_path = options_.index_path;
  staging_path += ".staging";
  index.persist(staging_path);

  IndexInfo info;
  info.embedding_model = embedding_service_->model_name();
  info.dimension = dimension;
  info.vector_count = index.size();
  info.built_at = std::chrono::system_clock::now();

  // Queries wait here until the file, the rows and the in-memory index agree
  std::unique_lock<std::shared_mutex> swap;
  if (retrieval_context_) {
    swap = retrieval_context_->swap_guard();
  }

  // The live file is swapped in before the commit and put back if it fails,
  // so the index on disk never pairs with rows from another run
  std::filesystem::path backup_path = options_.index_path;
  backup_path += ".previous";
  const bool had_previous = std::filesystem::exists(options_.index_path);
  try {
    if (had_previous) {
      std::filesystem::copy_file(options_.index_path, backup_path,
                                 std::filesystem::copy_options::overwrite_existing);
    }
    std::filesystem::rename(staging_path, options_.index_path);
  } catch (const std::filesystem::filesystem_error &e) {
    std::error_code ec;
    std::filesystem::remove(staging_path, ec);
    std::filesystem::remove(backup_path, ec);
    std::cerr << "[Ingestion] Could not replace index file, previous index kept: " << e.what()
              << std::endl;
    throw;
  }

  try {
    chunk_store_->commit_run(run, info);
  } catch (const std::exception &e) {
    restore_index_file(had_previous, backup_path);
    std::cerr << "[Ingestion] Commit failed, previous index kept: " << e.what() << std::endl;
    throw;
  }

  std::error_code ec;
  std::filesystem::remove(backup_path, ec);
  if (ec) {
    std::cerr << "Warning: could not remove " << backup_path.string() << ": " << ec.message()
              << std::endl;
  }

  if (retrieval_context_) {
    retrieval_context_->install(std::make_shared<const VectorIndex>(std::move(index)));
  }
  report.chunks_indexed = info.vector_count;
  report.dimension = dimension;
}

void IngestionService::restore_index_file(bool had_previous,
                                          const std::filesystem::path &backup_path) const {
  std::error_code ec;
  if (had_previous) {
    std::filesystem::rename(backup_path, options_.index_path, ec);
  } else {
    std::filesystem::remove(options_.index_path, ec);
  }
  if (ec) {
    std::cerr << "Error: could not restore index file " << options_.index_path.string() << ": "
              << ec.message() << ". Re-run ingestion." << std::endl;
  }
}

}  // namespace passage_core
