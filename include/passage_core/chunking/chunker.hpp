#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace passage_core {

/**
 * @class Chunker
 * @brief Splits page text into overlapping fixed-size word windows.
 *
 * Windows start every (window - overlap) words. The window that reaches the
 * last word is the final one and may be shorter than the others. Chunks whose
 * trimmed length is below the minimum are dropped as noise.
 *
 * Output depends only on the input text and the three parameters.
 */
class Chunker {
 public:
  static constexpr int DEFAULT_WINDOW_WORDS = 500;
  static constexpr int DEFAULT_OVERLAP_WORDS = 100;
  static constexpr size_t DEFAULT_MIN_CHUNK_CHARS = 50;

  // @throw std::invalid_argument unless 0 <= overlap < window
  explicit Chunker(int window_words = DEFAULT_WINDOW_WORDS,
                   int overlap_words = DEFAULT_OVERLAP_WORDS,
                   size_t min_chunk_chars = DEFAULT_MIN_CHUNK_CHARS);

  std::vector<std::string> chunk(const std::string &text) const;

  int window_words() const { return window_words_; }
  int overlap_words() const { return overlap_words_; }
  size_t min_chunk_chars() const { return min_chunk_chars_; }

  // Collapses every run of whitespace to one space and trims both ends
  static std::string normalize_whitespace(const std::string &text);
  static std::vector<std::string> split_words(const std::string &text);

 private:
  int window_words_;
  int overlap_words_;
  size_t min_chunk_chars_;
};

}  // namespace passage_core
