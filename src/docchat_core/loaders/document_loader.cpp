#include "docchat_core/loaders/document_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace docchat_core {

std::string DocumentLoader::read_file_content(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentLoaderError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentLoaderError("Failed reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string DocumentLoader::lowercase_extension(const fs::path &file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

}  // namespace docchat_core
