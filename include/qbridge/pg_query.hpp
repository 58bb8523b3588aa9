// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::PgQuery -- forward-only cursor over a PostgreSQL result.
//
// Design:
//   - Wraps PGresult* with RAII, rows are fully buffered by libpq
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow(), same shape as Sqlite3Query
//     and MariaQuery
//   - GetValue() maps the column's type OID: bool, integer and float
//     columns become typed values, numeric stays exact text, bytea is
//     unescaped into a blob

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include <libpq-fe.h>

#include "qbridge/value.hpp"

namespace qbridge {

class PgDb;

// Built-in type OIDs (pg_type.dat). The catalog headers are server-only.
constexpr Oid kPgBoolOid = 16;
constexpr Oid kPgByteaOid = 17;
constexpr Oid kPgInt8Oid = 20;
constexpr Oid kPgInt2Oid = 21;
constexpr Oid kPgInt4Oid = 23;
constexpr Oid kPgOidOid = 26;
constexpr Oid kPgFloat4Oid = 700;
constexpr Oid kPgFloat8Oid = 701;

// ---------------------------------------------------------------------------
// PgQuery
// ---------------------------------------------------------------------------

class PgQuery {
 public:
  PgQuery() = default;

  ~PgQuery() { Finalize(); }

  // Move
  PgQuery(PgQuery&& other) noexcept
      : res_(other.res_),
        row_(other.row_),
        num_rows_(other.num_rows_),
        num_fields_(other.num_fields_) {
    other.res_ = nullptr;
    other.row_ = 0;
    other.num_rows_ = 0;
    other.num_fields_ = 0;
  }

  PgQuery& operator=(PgQuery&& other) noexcept {
    if (this != &other) {
      Finalize();
      res_ = other.res_;
      row_ = other.row_;
      num_rows_ = other.num_rows_;
      num_fields_ = other.num_fields_;
      other.res_ = nullptr;
      other.row_ = 0;
      other.num_rows_ = 0;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  PgQuery(const PgQuery&) = delete;
  PgQuery& operator=(const PgQuery&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }
  int32_t NumRows() const { return num_rows_; }

  int32_t FieldIndex(const char* name) const {
    if (res_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = PQfname(res_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (res_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return PQfname(res_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (Eof() || col < 0 || col >= num_fields_) { return true; }
    return PQgetisnull(res_, row_, col) != 0;
  }

  bool FieldIsNull(const char* name) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? FieldIsNull(idx) : true;
  }

  // --- Typed accessors ---

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int64_t>(
        std::strtoll(PQgetvalue(res_, row_, col), nullptr, 10));
  }

  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt64(idx, null_value) : null_value;
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    return PQgetvalue(res_, row_, col);
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  /// Current field as a Value following the column's type OID.
  Value GetValue(int32_t col) const {
    if (FieldIsNull(col)) { return Value::Null(); }

    const char* raw = PQgetvalue(res_, row_, col);
    int32_t len = PQgetlength(res_, row_, col);
    switch (PQftype(res_, col)) {
      case kPgBoolOid:
        return Value::Bool(raw[0] == 't');
      case kPgInt2Oid:
      case kPgInt4Oid:
      case kPgInt8Oid:
      case kPgOidOid:
        return Value::Integer(
            static_cast<int64_t>(std::strtoll(raw, nullptr, 10)));
      case kPgFloat4Oid:
      case kPgFloat8Oid:
        return Value::Real(std::strtod(raw, nullptr));
      case kPgByteaOid: {
        size_t out_len = 0;
        unsigned char* bytes = PQunescapeBytea(
            reinterpret_cast<const unsigned char*>(raw), &out_len);
        if (bytes == nullptr) {
          return Value::Text(std::string(raw, static_cast<size_t>(len)));
        }
        Value out = Value::Blob(
            std::string(reinterpret_cast<const char*>(bytes), out_len));
        PQfreemem(bytes);
        return out;
      }
      default:
        return Value::Text(std::string(raw, static_cast<size_t>(len)));
    }
  }

  // --- Navigation ---

  bool Eof() const { return res_ == nullptr || row_ >= num_rows_; }

  void NextRow() {
    if (row_ < num_rows_) { ++row_; }
  }

  void Finalize() {
    if (res_ != nullptr) {
      PQclear(res_);
      res_ = nullptr;
    }
    row_ = 0;
    num_rows_ = 0;
    num_fields_ = 0;
  }

 private:
  friend class PgDb;

  explicit PgQuery(PGresult* res) : res_(res) {
    if (res_ != nullptr) {
      num_rows_ = PQntuples(res_);
      num_fields_ = PQnfields(res_);
    }
  }

  PGresult* res_ = nullptr;
  int32_t row_ = 0;
  int32_t num_rows_ = 0;
  int32_t num_fields_ = 0;
};

}  // namespace qbridge
