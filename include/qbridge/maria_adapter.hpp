// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::MariaAdapter -- MySQL-family server backend.
//
// Design:
//   - Owns one MariaDb session
//   - UseDatabase() rebinds the live session (mysql_select_db)
//   - Catalog queries use SHOW statements; SHOW COLUMNS exposes the key
//     kind (PRI / UNI / MUL) and Extra directly on each column row

#pragma once

#include <cstring>
#include <string>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/maria_db.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// MariaAdapter
// ---------------------------------------------------------------------------

class MariaAdapter : public Adapter {
 public:
  MariaAdapter() = default;
  ~MariaAdapter() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kMariaDb; }

  // --- Open / Close ---

  Error Connect(const ConnectParams& params) override {
    Error err = db_.Open(params);
    if (!err.ok()) {
      return Error::Make(ErrorCode::kConnectFailed, err.message);
    }
    return Error::Ok();
  }

  void Close() override { db_.Close(); }

  bool IsOpen() const override { return db_.IsOpen(); }

  // --- Catalog ---

  std::vector<std::string> ListDatabases(Error* out_error) override {
    return Names("SHOW DATABASES", out_error);
  }

  Error UseDatabase(const std::string& name) override {
    Error err = db_.SelectDb(name.c_str());
    if (!err.ok()) {
      return Error::Make(ErrorCode::kBackendError, err.message);
    }
    return Error::Ok();
  }

  std::string CurrentDatabase(Error* out_error) override {
    Error err;
    auto q = db_.ExecQuery("SELECT DATABASE()", &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return std::string();
    }
    return q.Eof() ? std::string() : std::string(q.GetString(0));
  }

  std::vector<std::string> ListTables(Error* out_error) override {
    return Names("SHOW FULL TABLES WHERE Table_type = 'BASE TABLE'",
                 out_error);
  }

  std::vector<ColumnDescriptor> DescribeTable(const std::string& table,
                                              Error* out_error) override {
    Error err;
    std::string sql = "SHOW COLUMNS FROM " + QuoteIdentifier(table, '`');
    auto q = db_.ExecQuery(sql.c_str(), &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
    }

    std::vector<ColumnDescriptor> columns;
    while (!q.Eof()) {
      ColumnDescriptor col;
      col.name = q.GetString("Field");
      col.type = q.GetString("Type");
      col.nullable = std::strcmp(q.GetString("Null"), "YES") == 0;

      const char* key = q.GetString("Key");
      col.is_primary_key = std::strcmp(key, "PRI") == 0;
      col.is_unique = std::strcmp(key, "UNI") == 0;
      col.has_index = std::strcmp(key, "MUL") == 0;

      if (!q.FieldIsNull("Default")) {
        col.default_value = std::string(q.GetString("Default"));
      }
      const char* extra = q.GetString("Extra");
      if (extra[0] != '\0') { col.extra = std::string(extra); }

      columns.push_back(std::move(col));
      q.NextRow();
    }
    return columns;
  }

  // --- Query ---

  QueryResult ExecuteQuery(const std::string& sql,
                           Error* out_error) override {
    Error err;
    auto q = db_.ExecQuery(sql.c_str(), &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kQueryFailed, err);
      return QueryResult{};
    }

    QueryResult result;
    while (!q.Eof()) {
      result.rows.push_back(RowFromCursor(q));
      q.NextRow();
    }
    return result;
  }

 private:
  std::vector<std::string> Names(const char* sql, Error* out_error) {
    Error err;
    auto q = db_.ExecQuery(sql, &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
    }
    return FirstColumn(q);
  }

  MariaDb db_;
};

}  // namespace qbridge
