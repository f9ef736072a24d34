#pragma once

#include <chrono>
#include <string>

namespace passage_core {

// Source document formats the extractors understand
enum class DocumentType { PDF, Text, Markdown, Unknown };

// Conversion utilities
std::string to_string(DocumentType type);
DocumentType document_type_from_string(const std::string& str);

// Text of a single page, numbered from 1
struct PageText {
  int page_number = 0;
  std::string text;
};

struct DocumentRecord {
  int id = 0;
  std::string filename;  // unique key
  std::string title;
  std::string content_hash;
  DocumentType document_type = DocumentType::Unknown;
  size_t file_size = 0;
  int page_count = 0;
  std::chrono::system_clock::time_point ingested_at;
};

// "indian_penal_code.pdf" -> "indian penal code"
std::string title_from_filename(const std::string& filename);

}  // namespace passage_core
