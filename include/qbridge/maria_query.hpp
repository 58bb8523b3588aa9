// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::MariaQuery -- forward-only query result for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_RES* (mysql_store_result) with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow()
//   - Type-safe field accessors with null defaults
//   - GetValue() follows the column's MYSQL_FIELD type: integers and
//     floats become numbers, DECIMAL stays exact text, binary columns
//     become blobs

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

#include <mysql.h>

#include "qbridge/error.hpp"
#include "qbridge/value.hpp"

namespace qbridge {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaQuery
// ---------------------------------------------------------------------------

class MariaQuery {
 public:
  MariaQuery() = default;

  ~MariaQuery() { Finalize(); }

  // Move
  MariaQuery(MariaQuery&& other) noexcept
      : res_(other.res_),
        row_(other.row_),
        lengths_(other.lengths_),
        fields_(other.fields_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.res_ = nullptr;
    other.row_ = nullptr;
    other.lengths_ = nullptr;
    other.fields_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  MariaQuery& operator=(MariaQuery&& other) noexcept {
    if (this != &other) {
      Finalize();
      res_ = other.res_;
      row_ = other.row_;
      lengths_ = other.lengths_;
      fields_ = other.fields_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.res_ = nullptr;
      other.row_ = nullptr;
      other.lengths_ = nullptr;
      other.fields_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  MariaQuery(const MariaQuery&) = delete;
  MariaQuery& operator=(const MariaQuery&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (fields_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      if (fields_[i].name != nullptr &&
          std::strcmp(name, fields_[i].name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (fields_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return fields_[col].name;
  }

  bool FieldIsNull(int32_t col) const {
    if (row_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return row_[col] == nullptr;
  }

  bool FieldIsNull(const char* name) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? FieldIsNull(idx) : true;
  }

  // --- Typed accessors ---

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int64_t>(std::strtoll(row_[col], nullptr, 10));
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    return row_[col];
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  /// Current field as a Value following the column's wire type.
  Value GetValue(int32_t col) const {
    if (FieldIsNull(col) || fields_ == nullptr) { return Value::Null(); }

    const MYSQL_FIELD& field = fields_[col];
    size_t len = (lengths_ != nullptr) ? static_cast<size_t>(lengths_[col])
                                       : std::strlen(row_[col]);
    std::string raw(row_[col], len);

    switch (field.type) {
      case MYSQL_TYPE_TINY:
      case MYSQL_TYPE_SHORT:
      case MYSQL_TYPE_INT24:
      case MYSQL_TYPE_LONG:
      case MYSQL_TYPE_LONGLONG:
      case MYSQL_TYPE_YEAR: {
        if ((field.flags & UNSIGNED_FLAG) != 0) {
          errno = 0;
          unsigned long long u = std::strtoull(raw.c_str(), nullptr, 10);
          if (errno != 0 || u > static_cast<unsigned long long>(
                                    std::numeric_limits<int64_t>::max())) {
            return Value::Text(raw);
          }
          return Value::Integer(static_cast<int64_t>(u));
        }
        return Value::Integer(
            static_cast<int64_t>(std::strtoll(raw.c_str(), nullptr, 10)));
      }
      case MYSQL_TYPE_FLOAT:
      case MYSQL_TYPE_DOUBLE:
        return Value::Real(std::strtod(raw.c_str(), nullptr));
      case MYSQL_TYPE_BIT:
        return Value::Blob(raw);
      case MYSQL_TYPE_TINY_BLOB:
      case MYSQL_TYPE_MEDIUM_BLOB:
      case MYSQL_TYPE_LONG_BLOB:
      case MYSQL_TYPE_BLOB:
      case MYSQL_TYPE_STRING:
      case MYSQL_TYPE_VAR_STRING:
        // charsetnr 63 is the "binary" collation.
        if ((field.flags & BINARY_FLAG) != 0 && field.charsetnr == 63) {
          return Value::Blob(raw);
        }
        return Value::Text(raw);
      default:
        return Value::Text(raw);
    }
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  void NextRow() {
    if (res_ == nullptr) { return; }
    row_ = mysql_fetch_row(res_);
    if (row_ != nullptr) {
      lengths_ = mysql_fetch_lengths(res_);
    } else {
      eof_ = true;
      lengths_ = nullptr;
    }
  }

  void Finalize() {
    if (res_ != nullptr) {
      mysql_free_result(res_);
      res_ = nullptr;
    }
    row_ = nullptr;
    lengths_ = nullptr;
    fields_ = nullptr;
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class MariaDb;

  MariaQuery(MYSQL_RES* res, bool eof)
      : res_(res), eof_(eof) {
    if (res_ != nullptr) {
      num_fields_ = static_cast<int32_t>(mysql_num_fields(res_));
      fields_ = mysql_fetch_fields(res_);
      if (!eof_) {
        row_ = mysql_fetch_row(res_);
        if (row_ != nullptr) {
          lengths_ = mysql_fetch_lengths(res_);
        } else {
          eof_ = true;
        }
      }
    }
  }

  MYSQL_RES* res_ = nullptr;
  MYSQL_ROW row_ = nullptr;
  unsigned long* lengths_ = nullptr;
  MYSQL_FIELD* fields_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace qbridge
