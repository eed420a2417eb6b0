#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docchat_core {

inline std::string sqlite_error_kind(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy_or_locked";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_FULL:
      return "full";
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return "corrupt";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

// Corrupt or foreign files surface as these codes when a docstore is opened
inline bool is_corruption_code(int primary_code) {
  return primary_code == SQLITE_CORRUPT || primary_code == SQLITE_NOTADB;
}

inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  std::string msg = operation + " failed: (" + sqlite_error_kind(code) + ") " + e.errstr();
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
  return msg;
}

}  // namespace docchat_core
