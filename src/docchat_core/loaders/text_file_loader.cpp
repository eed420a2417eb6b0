#include "docchat_core/loaders/text_file_loader.hpp"

#include <utf8.h>

#include <iostream>
#include <iterator>

namespace docchat_core {

bool TextFileLoader::can_handle(const fs::path &file_path) const {
  const std::string extension = lowercase_extension(file_path);
  return extension == ".txt" || extension == ".md";
}

LoadedDocument TextFileLoader::load(const fs::path &file_path) const {
  std::string content = read_file_content(file_path);

  // Drop a UTF-8 byte order mark
  if (utf8::starts_with_bom(content.begin(), content.end())) {
    content.erase(0, 3);
  }

  if (!utf8::is_valid(content.begin(), content.end())) {
    std::cerr << "Warning: replacing invalid UTF-8 in " << file_path.filename() << std::endl;
    std::string repaired;
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(repaired));
    content = std::move(repaired);
  }

  return {.text = std::move(content), .source_id = file_path.filename().string()};
}

}  // namespace docchat_core
