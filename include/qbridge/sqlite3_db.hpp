// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Sqlite3Db -- SQLite3 database connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Open() reads the schema so unreadable or non-database files fail
//     immediately instead of on the first query

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "qbridge/error.hpp"
#include "qbridge/sqlite3_query.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() { Close(); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  /// Open (creating if missing) the database file at `path`.
  Error Open(const char* path,
             int32_t flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t rc = sqlite3_open_v2(path, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::Make(ErrorCode::kError,
                              db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      Close();
      return err;
    }

    // sqlite3_open_v2 defers reading the header until the first statement.
    Error check_err;
    ExecQuery("SELECT count(*) FROM sqlite_master;", &check_err);
    if (!check_err.ok()) {
      Close();
      return check_err;
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute one or more statements without results.
  /// Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return -1;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return -1;
    }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError,
                     errmsg ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Query ---

  /// Compile and step the first statement of `sql`. Any trailing
  /// statements are ignored. Returns a cursor positioned on the first row.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return Sqlite3Query{};
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return Sqlite3Query{};
    }

    sqlite3_stmt* stmt = Compile(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Query{}; }

    int32_t rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
      return Sqlite3Query(db_, stmt, true);
    }
    if (rc == SQLITE_ROW) {
      return Sqlite3Query(db_, stmt, false);
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return Sqlite3Query{};
  }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

 private:
  sqlite3_stmt* Compile(const char* sql, Error* out_error) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
      }
      return nullptr;
    }
    if (stmt == nullptr) {
      // Empty or comment-only SQL compiles to no statement.
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "no statement to execute");
      }
    }
    return stmt;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace qbridge
