#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docchat_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CompressionService {
 public:
  /**
   * @brief Compresses chunk text with Zstandard for storage in the docstore.
   * @param text The text to compress.
   * @param compression_level zstd level, clamped to the range the library supports.
   * @return The compressed frame, empty for empty input.
   */
  static std::vector<char> compress(std::string_view text, int compression_level = 3);

  /**
   * @brief Restores text written by compress().
   * @throw CompressionError if the blob is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace docchat_core
