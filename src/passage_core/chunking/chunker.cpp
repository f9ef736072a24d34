#include "passage_core/chunking/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace passage_core {

namespace {
bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}  // namespace

Chunker::Chunker(int window_words, int overlap_words, size_t min_chunk_chars)
    : window_words_(window_words),
      overlap_words_(overlap_words),
      min_chunk_chars_(min_chunk_chars) {
  if (window_words_ <= 0) {
    throw std::invalid_argument("Chunk window must be at least one word, got " +
                                std::to_string(window_words_));
  }
  if (overlap_words_ < 0) {
    throw std::invalid_argument("Chunk overlap cannot be negative, got " +
                                std::to_string(overlap_words_));
  }
  if (overlap_words_ >= window_words_) {
    throw std::invalid_argument("Chunk overlap (" + std::to_string(overlap_words_) +
                                ") must be smaller than the window (" +
                                std::to_string(window_words_) + ")");
  }
}

std::string Chunker::normalize_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> Chunker::split_words(const std::string &text) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_space(text[i])) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && !is_space(text[i])) {
      ++i;
    }
    if (i > start) {
      words.emplace_back(text, start, i - start);
    }
  }
  return words;
}

std::vector<std::string> Chunker::chunk(const std::string &text) const {
  const std::vector<std::string> words = split_words(normalize_whitespace(text));
  std::vector<std::string> chunks;
  if (words.empty()) {
    return chunks;
  }

  const size_t window = static_cast<size_t>(window_words_);
  const size_t step = static_cast<size_t>(window_words_ - overlap_words_);

  for (size_t begin = 0; begin < words.size(); begin += step) {
    const size_t end = std::min(begin + window, words.size());

    std::string chunk_text = words[begin];
    for (size_t w = begin + 1; w < end; ++w) {
      chunk_text += ' ';
      chunk_text += words[w];
    }
    if (chunk_text.size() >= min_chunk_chars_) {
      chunks.push_back(std::move(chunk_text));
    }

    if (end == words.size()) {
      break;
    }
  }
  return chunks;
}

}  // namespace passage_core
