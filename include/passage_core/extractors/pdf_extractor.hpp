#pragma once

#include "content_extractor.hpp"

namespace passage_core {

/**
 * @class PdfExtractor
 * @brief Extracts per-page text from PDF documents.
 *
 * Poppler's text layer is tried first. If poppler cannot open or read the
 * document, QPDF content-stream parsing is used instead. When both fail the
 * document yields no pages, which the ingestion run treats as "nothing
 * extracted" rather than an error.
 */
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::vector<PageText> extract_pages(const fs::path& file_path) const override;

  DocumentType get_document_type() const override { return DocumentType::PDF; }

  // Exposed for tests and diagnostics. Both throw ContentExtractorError when
  // the document cannot be opened.
  std::vector<PageText> extract_with_poppler(const fs::path& file_path) const;
  std::vector<PageText> extract_with_qpdf(const fs::path& file_path) const;
};

}  // namespace passage_core
