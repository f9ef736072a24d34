#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "passage_core/types/document.hpp"

namespace fs = std::filesystem;

namespace passage_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Ordered (page_number, text) pairs, 1-based. Pages without extractable
  // text are left out, so page numbers may have gaps.
  virtual std::vector<PageText> extract_pages(const fs::path& file_path) const = 0;

  virtual DocumentType get_document_type() const = 0;

  // SHA-256 of the raw file bytes, hex encoded
  std::string get_content_hash(const fs::path& file_path) const;

 protected:
  std::string get_string_content(const fs::path& file_path) const;
  std::string compute_hash_from_content(const std::string& content) const;

  // Replaces invalid UTF-8 sequences so downstream consumers never see them
  static std::string sanitize_utf8(const std::string& text);

  // Appends the page only if it has non-whitespace text
  static void append_page(std::vector<PageText>& pages, int page_number, const std::string& text);
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace passage_core
