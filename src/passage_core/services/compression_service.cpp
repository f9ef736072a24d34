#include "passage_core/services/compression_service.hpp"

#include <zstd.h>

namespace passage_core {

std::vector<char> CompressionService::compress(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }

  std::vector<char> blob(ZSTD_compressBound(text.size()));
  const size_t written = ZSTD_compress(blob.data(), blob.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  blob.resize(written);
  return blob;
}

std::string CompressionService::decompress(const std::vector<char> &blob) {
  if (blob.empty()) {
    return "";
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Chunk content is not a zstd frame with a known size");
  }

  std::string text(content_size, '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), blob.data(), blob.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw CompressionError("zstd decompression produced " + std::to_string(read) +
                           " bytes, expected " + std::to_string(content_size));
  }
  return text;
}

}  // namespace passage_core
