#include "docchat_core/services/compression_service.hpp"

#include <zstd.h>

#include <algorithm>

namespace docchat_core {

std::vector<char> CompressionService::compress(std::string_view text, int compression_level) {
  if (text.empty()) {
    return {};
  }
  const int level = std::clamp(compression_level, ZSTD_minCLevel(), ZSTD_maxCLevel());

  std::vector<char> buffer(ZSTD_compressBound(text.size()));
  const size_t written = ZSTD_compress(buffer.data(), buffer.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Blob is not a zstd frame with a known content size");
  }

  std::string text(content_size, '\0');
  const size_t restored =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(restored)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(restored)));
  }
  if (restored != content_size) {
    throw CompressionError("zstd frame truncated: expected " + std::to_string(content_size) +
                           " bytes, got " + std::to_string(restored));
  }
  return text;
}

}  // namespace docchat_core
