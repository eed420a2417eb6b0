#pragma once

#include <string>

namespace docchat_core {

// Collapses every run of whitespace to a single space and trims both ends
std::string normalize_for_fingerprint(const std::string &text);

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(const std::string &content);

/*
Deduplication key for a chunk. The digest covers the normalized text, prefixed
with the source id and a NUL separator when include_source is set.
*/
std::string compute_fingerprint(const std::string &text,
                                const std::string &source_id = "",
                                bool include_source = false);

}  // namespace docchat_core
