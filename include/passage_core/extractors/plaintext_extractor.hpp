#pragma once

#include "content_extractor.hpp"

namespace passage_core {

// Form feeds ('\f') separate pages, as in pdftotext output. A file without
// form feeds is a single page.
class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    std::vector<PageText> extract_pages(const fs::path& file_path) const override;

    DocumentType get_document_type() const override { return DocumentType::Text; }
};

}
