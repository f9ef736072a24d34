#pragma once

#include <exception>
#include <string>

namespace passage_core {

class PassageError : public std::exception {
 public:
  explicit PassageError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Nothing could be chunked from the corpus. Ingestion stops without touching
// the persisted index or the chunk store.
class EmptyCorpusError : public PassageError {
 public:
  using PassageError::PassageError;
};

// No persisted index on disk. Callers fall back to generation-only answers.
class IndexNotFoundError : public PassageError {
 public:
  using PassageError::PassageError;
};

// Embedding dimensionality differs from what the index was built with.
// This is a configuration error and is never truncated away.
class DimensionMismatchError : public PassageError {
 public:
  DimensionMismatchError(size_t expected, size_t actual, const std::string &where)
      : PassageError(where + ": embedding dimension mismatch. Expected " +
                     std::to_string(expected) + ", got " + std::to_string(actual) +
                     ". Check the embedding model setting or re-run ingestion."),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

 private:
  size_t expected_;
  size_t actual_;
};

// Staged chunks and index vectors disagree. Nothing is persisted.
class SlotCorrelationError : public PassageError {
 public:
  using PassageError::PassageError;
};

// Query-time failure (embedding call failed, timed out, ...)
class RetrievalError : public PassageError {
 public:
  using PassageError::PassageError;
};

class IngestionInProgressError : public PassageError {
 public:
  using PassageError::PassageError;
};

}  // namespace passage_core
