#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace passage_core {

class CompressionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// zstd frames for chunk text stored in the chunk store
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses chunk text into a single zstd frame.
   * @param text Text to compress. Empty input yields an empty blob.
   * @param level zstd compression level.
   * @throw CompressionError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view text, int level = DEFAULT_LEVEL);

  /**
   * @brief Restores text written by compress().
   * @throw CompressionError if the blob is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &blob);
};

}  // namespace passage_core
