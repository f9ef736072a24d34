#include "passage_core/extractors/plaintext_extractor.hpp"

namespace passage_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    const std::string extension = file_path.extension().string();
    return extension == ".txt";
}

/**
 * @brief Reads a plain text file and splits it into pages.
 *
 * Page numbers count every form-feed separated section, including blank
 * ones, so a blank page still advances the numbering.
 */
std::vector<PageText> PlainTextExtractor::extract_pages(const std::filesystem::path& file_path) const {
    const std::string content = get_string_content(file_path);

    std::vector<PageText> pages;
    if (content.empty()) {
        return pages;
    }

    int page_number = 1;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\f', start);
        if (end == std::string::npos) {
            end = content.size();
        }
        append_page(pages, page_number, content.substr(start, end - start));
        ++page_number;
        start = end + 1;
    }

    return pages;
}

} // namespace passage_core
