#include "passage_core/types.hpp"

#include <algorithm>
#include <filesystem>

namespace passage_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::PDF:
      return "PDF";
    case DocumentType::Text:
      return "Text";
    case DocumentType::Markdown:
      return "Markdown";
    default:
      return "Unknown";
  }
}

DocumentType document_type_from_string(const std::string& str) {
  if (str == "PDF")
    return DocumentType::PDF;
  if (str == "Text")
    return DocumentType::Text;
  if (str == "Markdown")
    return DocumentType::Markdown;
  return DocumentType::Unknown;
}

std::string title_from_filename(const std::string& filename) {
  std::string title = std::filesystem::path(filename).stem().string();
  std::replace(title.begin(), title.end(), '_', ' ');
  return title;
}

}  // namespace passage_core
