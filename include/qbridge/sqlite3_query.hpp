// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Sqlite3Query -- forward-only query cursor.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow(); step errors are reported,
//     not folded into end-of-rows
//   - Type-safe field accessors with null defaults
//   - GetValue() keeps SQLite's storage class (integer/real/text/blob)

#pragma once

#include <cstdint>
#include <cstring>
#include <string>

#include "sqlite3.h"

#include "qbridge/error.hpp"
#include "qbridge/value.hpp"

namespace qbridge {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  // Move
  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = sqlite3_column_name(stmt_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return sqlite3_column_name(stmt_, col);
  }

  int32_t FieldDataType(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return -1; }
    return sqlite3_column_type(stmt_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Typed accessors ---

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int64(stmt_, col);
  }

  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt64(idx, null_value) : null_value;
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_double(stmt_, col);
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    const char* val =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    return (val != nullptr) ? val : null_value;
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  bool FieldIsNull(const char* name) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? FieldIsNull(idx) : true;
  }

  const uint8_t* GetBlob(int32_t col, int32_t& out_len) const {
    out_len = 0;
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    const void* blob = sqlite3_column_blob(stmt_, col);
    out_len = sqlite3_column_bytes(stmt_, col);
    return static_cast<const uint8_t*>(blob);
  }

  /// Current field as a Value tagged with SQLite's storage class.
  Value GetValue(int32_t col) const {
    switch (FieldDataType(col)) {
      case SQLITE_INTEGER:
        return Value::Integer(sqlite3_column_int64(stmt_, col));
      case SQLITE_FLOAT:
        return Value::Real(sqlite3_column_double(stmt_, col));
      case SQLITE_TEXT: {
        const char* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        int32_t len = sqlite3_column_bytes(stmt_, col);
        return Value::Text(std::string(text != nullptr ? text : "",
                                       static_cast<size_t>(len)));
      }
      case SQLITE_BLOB: {
        int32_t len = 0;
        const uint8_t* blob = GetBlob(col, len);
        if (blob == nullptr) { return Value::Blob(std::string()); }
        return Value::Blob(std::string(reinterpret_cast<const char*>(blob),
                                       static_cast<size_t>(len)));
      }
      default:
        return Value::Null();
    }
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Advance to the next row. A step failure ends iteration and is
  /// written to `out_error`.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class Sqlite3Db;

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace qbridge
