#include "passage_core/extractors/content_extractor_factory.hpp"
#include "passage_core/extractors/markdown_extractor.hpp"
#include "passage_core/extractors/pdf_extractor.hpp"
#include "passage_core/extractors/plaintext_extractor.hpp"

namespace passage_core {
ContentExtractorFactory::ContentExtractorFactory() {
    extractors.push_back(std::make_unique<PdfExtractor>());
    extractors.push_back(std::make_unique<MarkdownExtractor>());
    extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(file_path)) {
            return *extractor;
        }
    }
    throw ContentExtractorError("No suitable content extractor found for " +
                                file_path.string());
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(file_path)) {
            return true;
        }
    }
    return false;
}
}  // namespace passage_core
