#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "passage_core/types/retrieval.hpp"

namespace passage_core {

// Turns ranked results into provenance-tagged text for a generation prompt
class ContextAssembler {
 public:
  static constexpr size_t DEFAULT_MAX_CHARS = 3000;
  static constexpr size_t DEFAULT_PREVIEW_CHARS = 200;

  // "[Source i: <title or filename>, Page p]\n<text>\n"
  static std::string render_block(const RetrievalResult &result, size_t source_index);

  /**
   * @brief Joins rendered blocks with "\n" in rank order.
   *
   * A block is added only if the output, separator included, stays within
   * max_chars. Assembly stops at the first block that does not fit, so the
   * output is always a prefix of the unbounded concatenation.
   */
  static std::string assemble(const std::vector<RetrievalResult> &results,
                              size_t max_chars = DEFAULT_MAX_CHARS);

  static std::vector<SourceSummary> summarize_sources(const std::vector<RetrievalResult> &results,
                                                      size_t preview_chars = DEFAULT_PREVIEW_CHARS);
};

}  // namespace passage_core
