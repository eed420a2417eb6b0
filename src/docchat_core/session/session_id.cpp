#include "docchat_core/session/session_id.hpp"

#include <openssl/rand.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace docchat_core {

namespace {

uint32_t random_suffix() {
  unsigned char bytes[4];
  if (RAND_bytes(bytes, sizeof(bytes)) == 1) {
    return (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
  }
  // CSPRNG unavailable, fall back to the platform source
  std::random_device rd;
  return static_cast<uint32_t>(rd());
}

}  // namespace

std::string generate_session_id() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);

  std::stringstream ss;
  ss << "session_" << std::put_time(&tm_struct, "%Y%m%d_%H%M%S") << "_" << std::hex
     << std::setw(8) << std::setfill('0') << random_suffix();
  return ss.str();
}

bool is_valid_session_id(const std::string &session_id) {
  if (session_id.empty() || session_id.size() > 128) {
    return false;
  }
  for (char c : session_id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

}  // namespace docchat_core
