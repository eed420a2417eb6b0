#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docchat_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace docchat_core {

class DocumentLoaderError : public std::exception {
 public:
  explicit DocumentLoaderError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocumentLoader {
 public:
  virtual ~DocumentLoader() = default;

  // Checks if this loader can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const = 0;

  // Reads the file into normalized text; source_id is the file name
  virtual LoadedDocument load(const fs::path &file_path) const = 0;

 protected:
  std::string read_file_content(const fs::path &file_path) const;
  static std::string lowercase_extension(const fs::path &file_path);
};

using DocumentLoaderPtr = std::unique_ptr<DocumentLoader>;

}  // namespace docchat_core
