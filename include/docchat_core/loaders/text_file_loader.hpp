#pragma once

#include "docchat_core/loaders/document_loader.hpp"

namespace docchat_core {

// Plain text and markdown. Invalid UTF-8 sequences are replaced, never rejected.
class TextFileLoader : public DocumentLoader {
 public:
  bool can_handle(const fs::path &file_path) const override;

  LoadedDocument load(const fs::path &file_path) const override;
};

}  // namespace docchat_core
