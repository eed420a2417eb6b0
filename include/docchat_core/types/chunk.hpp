#pragma once

#include <cstddef>
#include <string>

namespace docchat_core {

// Normalized output of every document loader, whatever the original file type
struct LoadedDocument {
  std::string text;
  std::string source_id;
};

struct Chunk {
  std::string content;
  std::string source_id;
  int chunk_index = 0;
  // Offset in code points into the source document text
  size_t start_offset = 0;
  std::string fingerprint;
};

}  // namespace docchat_core
