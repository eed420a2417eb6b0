#include "docchat_core/loaders/upload_storage.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#include "docchat_core/loaders/document_loader.hpp"

namespace docchat_core {

namespace {

std::string random_hex(size_t digits) {
  static thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<int> nibble(0, 15);
  std::stringstream ss;
  for (size_t i = 0; i < digits; ++i) {
    ss << std::hex << nibble(generator);
  }
  return ss.str();
}

}  // namespace

std::string sanitize_file_stem(const std::string &file_name) {
  std::string stem = std::filesystem::path(file_name).stem().string();
  for (auto &c : stem) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) && uc < 0x80) {
      c = static_cast<char>(std::tolower(uc));
    } else if (c != '_' && c != '-') {
      c = '_';
    }
  }
  if (stem.empty()) {
    stem = "file";
  }
  return stem;
}

std::filesystem::path save_uploaded_file(const std::filesystem::path &target_dir,
                                         const std::string &original_name,
                                         const std::string &data) {
  std::error_code ec;
  std::filesystem::create_directories(target_dir, ec);
  if (ec) {
    throw DocumentLoaderError("Failed to create upload directory " + target_dir.string() + ": " +
                              ec.message());
  }

  std::string extension = std::filesystem::path(original_name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  const auto out_path =
      target_dir / (sanitize_file_stem(original_name) + "_" + random_hex(6) + extension);

  std::ofstream out(out_path, std::ios::binary);
  if (!out.is_open()) {
    throw DocumentLoaderError("Could not open file for writing: " + out_path.string());
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out) {
    throw DocumentLoaderError("Failed writing file: " + out_path.string());
  }

  std::cout << "File saved for ingestion: " << original_name << " -> " << out_path << std::endl;
  return out_path;
}

}  // namespace docchat_core
