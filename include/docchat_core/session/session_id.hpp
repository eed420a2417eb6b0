#pragma once

#include <string>

namespace docchat_core {

/*
Generates a session identifier of the form session_YYYYMMDD_HHMMSS_xxxxxxxx.
The timestamp is UTC, the suffix is 32 random bits in lowercase hex.
*/
std::string generate_session_id();

// Session ids become directory names, so only [A-Za-z0-9_-] is accepted
bool is_valid_session_id(const std::string &session_id);

}  // namespace docchat_core
