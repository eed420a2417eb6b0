#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "docchat_core/loaders/document_loader.hpp"

namespace docchat_core {

/**
 * @class DocumentLoaderFactory
 * @brief Picks the loader for a file by its extension.
 *
 * Non-copyable and non-movable.
 */
class DocumentLoaderFactory {
 public:
  DocumentLoaderFactory();

  /**
   * @brief Returns the first registered loader that handles the file.
   * @return nullptr when the file type is not supported.
   */
  const DocumentLoader *get_loader_for(const std::filesystem::path &file_path) const;

  bool is_supported(const std::filesystem::path &file_path) const {
    return get_loader_for(file_path) != nullptr;
  }

  /**
   * @brief Loads every supported file, skipping the rest with a warning.
   * @throw DocumentLoaderError if a supported file cannot be read.
   */
  std::vector<LoadedDocument> load_documents(const std::vector<std::filesystem::path> &paths) const;

  DocumentLoaderFactory(const DocumentLoaderFactory &) = delete;
  DocumentLoaderFactory &operator=(const DocumentLoaderFactory &) = delete;
  DocumentLoaderFactory(DocumentLoaderFactory &&) = delete;
  DocumentLoaderFactory &operator=(DocumentLoaderFactory &&) = delete;

 private:
  std::vector<std::unique_ptr<DocumentLoader>> loaders_;
};

}  // namespace docchat_core
