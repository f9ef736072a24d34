#pragma once
#include "content_extractor.hpp"

namespace passage_core {

class MarkdownExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    std::vector<PageText> extract_pages(const fs::path& file_path) const override;

    DocumentType get_document_type() const override { return DocumentType::Markdown; }

private:
    // Helper method to strip markup from already-loaded content
    std::string strip_markup(const std::string& content) const;
};

}
