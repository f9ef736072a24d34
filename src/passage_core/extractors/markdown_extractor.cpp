#include "passage_core/extractors/markdown_extractor.hpp"

#include <regex>
#include <sstream>

namespace passage_core {
bool MarkdownExtractor::can_handle(const std::filesystem::path& file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".md" || extension == ".markdown";
}

// A markdown file has no page structure, so the whole file is page 1
std::vector<PageText> MarkdownExtractor::extract_pages(const std::filesystem::path& file_path) const {
  std::string content = get_string_content(file_path);

  std::vector<PageText> pages;
  if (content.empty()) {
    return pages;
  }

  append_page(pages, 1, strip_markup(content));
  return pages;
}

std::string MarkdownExtractor::strip_markup(const std::string& content) const {
  const std::regex fence_regex(R"(^\s*(```|~~~).*$)");
  const std::regex heading_regex(R"(^\s{0,3}#{1,6}\s+)");
  const std::regex emphasis_regex(R"((\*\*|__|\*|`))");
  const std::regex link_regex(R"(\[([^\]]*)\]\([^)]*\))");

  std::stringstream in(content);
  std::stringstream out;
  std::string line;
  while (std::getline(in, line)) {
    if (std::regex_match(line, fence_regex)) {
      continue;
    }
    line = std::regex_replace(line, heading_regex, "");
    line = std::regex_replace(line, link_regex, "$1");
    line = std::regex_replace(line, emphasis_regex, "");
    out << line << '\n';
  }
  return out.str();
}
}  // namespace passage_core
