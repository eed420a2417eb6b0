#pragma once

#include <filesystem>
#include <string>

namespace docchat_core {

// Lowercased stem with every character outside [A-Za-z0-9_-] replaced by '_'
std::string sanitize_file_stem(const std::string &file_name);

/**
 * @brief Writes an uploaded file under target_dir as <sanitized stem>_<6 hex><ext>.
 *
 * The random suffix keeps two uploads with the same name apart.
 * @return Path of the written file.
 * @throw DocumentLoaderError if the directory or the file cannot be written.
 */
std::filesystem::path save_uploaded_file(const std::filesystem::path &target_dir,
                                         const std::string &original_name,
                                         const std::string &data);

}  // namespace docchat_core
