#include "docchat_core/loaders/document_loader_factory.hpp"

#include <iostream>

#include "docchat_core/loaders/text_file_loader.hpp"

namespace docchat_core {

DocumentLoaderFactory::DocumentLoaderFactory() {
  loaders_.push_back(std::make_unique<TextFileLoader>());
}

const DocumentLoader *DocumentLoaderFactory::get_loader_for(
    const std::filesystem::path &file_path) const {
  for (const auto &loader : loaders_) {
    if (loader->can_handle(file_path)) {
      return loader.get();
    }
  }
  return nullptr;
}

std::vector<LoadedDocument> DocumentLoaderFactory::load_documents(
    const std::vector<std::filesystem::path> &paths) const {
  std::vector<LoadedDocument> documents;
  for (const auto &path : paths) {
    const DocumentLoader *loader = get_loader_for(path);
    if (!loader) {
      std::cerr << "Warning: unsupported extension skipped: " << path << std::endl;
      continue;
    }
    documents.push_back(loader->load(path));
  }
  std::cout << "Documents loaded: " << documents.size() << std::endl;
  return documents;
}

}  // namespace docchat_core
