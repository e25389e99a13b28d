#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace finbot_core {

// How a failed knowledge database statement should be read by an operator
enum class DbErrorKind {
  Busy,           // another writer holds the lock past busy_timeout
  DuplicateHash,  // a chunk with the same content hash is already mirrored
  DuplicateId,    // the chunk id is already mirrored
  Constraint,
  Storage,        // disk full, read-only, I/O or open failure
  Corrupt,        // file is damaged or is not a database
  Generic
};

inline DbErrorKind classify_db_error(const sqlite::sqlite_exception& e) {
  switch (e.get_extended_code()) {
    case SQLITE_CONSTRAINT_UNIQUE:
      return DbErrorKind::DuplicateHash;
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return DbErrorKind::DuplicateId;
    default:
      break;
  }
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return DbErrorKind::Storage;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy: return "busy";
    case DbErrorKind::DuplicateHash: return "duplicate_content_hash";
    case DbErrorKind::DuplicateId: return "duplicate_chunk_id";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Storage: return "storage";
    case DbErrorKind::Corrupt: return "corrupt";
    default: return "generic";
  }
}

// "<operation> failed: (<kind>) <sqlite message> [xcode=..]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed: (" + kind_to_string(classify_db_error(e)) + ") " + e.errstr() +
         " [xcode=" + std::to_string(e.get_extended_code()) + "]";
}

} // namespace finbot_core
