#include "passage_core/retrieval/context_assembler.hpp"

namespace passage_core {

std::string ContextAssembler::render_block(const RetrievalResult &result, size_t source_index) {
  const std::string &label = result.document_title.empty() ? result.document
                                                           : result.document_title;
  return "[Source " + std::to_string(source_index) + ": " + label + ", Page " +
         std::to_string(result.page) + "]\n" + result.text + "\n";
}

std::string ContextAssembler::assemble(const std::vector<RetrievalResult> &results,
                                       size_t max_chars) {
  std::string output;
  for (size_t i = 0; i < results.size(); ++i) {
    const std::string block = render_block(results[i], i + 1);
    const size_t separator = output.empty() ? 0 : 1;
    if (output.size() + separator + block.size() > max_chars) {
      break;
    }
    if (separator) {
      output += "\n";
    }
    output += block;
  }
  return output;
}

std::vector<SourceSummary> ContextAssembler::summarize_sources(
    const std::vector<RetrievalResult> &results, size_t preview_chars) {
  std::vector<SourceSummary> summaries;
  summaries.reserve(results.size());
  for (const auto &result : results) {
    SourceSummary summary;
    summary.document = result.document;
    summary.page = result.page;
    summary.score = result.score;
    if (result.text.size() > preview_chars) {
      // Never cut inside a UTF-8 sequence
      size_t cut = preview_chars;
      while (cut > 0 && (static_cast<unsigned char>(result.text[cut]) & 0xC0) == 0x80) {
        --cut;
      }
      summary.text = result.text.substr(0, cut) + "...";
    } else {
      summary.text = result.text;
    }
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

}  // namespace passage_core
