// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::PgAdapter -- PostgreSQL server backend.
//
// Design:
//   - Owns one PgDb session, bound to one database for its lifetime
//   - RebindsInPlace() is false: the registry switches databases by
//     opening a replacement PgAdapter
//   - Tables and columns come from information_schema in the "public"
//     schema; primary key and unique flags need a separate
//     table_constraints / key_column_usage join, index flags read pg_index

#pragma once

#include <string>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/pg_db.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// PgAdapter
// ---------------------------------------------------------------------------

class PgAdapter : public Adapter {
 public:
  PgAdapter() = default;
  ~PgAdapter() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kPostgres; }

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
    Error err;
    auto q = db_.ExecQuery(
        "SELECT datname FROM pg_database WHERE datistemplate = false", &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
    }
    return FirstColumn(q);
  }

  bool RebindsInPlace() const override { return false; }

  Error UseDatabase(const std::string& /*name*/) override {
    return Error::Make(ErrorCode::kMisuse,
                       "PostgreSQL sessions cannot switch database; "
                       "open a new session instead");
  }

  std::string CurrentDatabase(Error* out_error) override {
    if (!db_.IsOpen()) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kBackendError, "Database not open");
      }
      return std::string();
    }
    return db_.DatabaseName();
  }

  std::vector<std::string> ListTables(Error* out_error) override {
    Error err;
    auto q = db_.ExecQuery(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = 'public' AND table_type = 'BASE TABLE'",
        &err);
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
    }
    return FirstColumn(q);
  }

  std::vector<ColumnDescriptor> DescribeTable(const std::string& table,
                                              Error* out_error) override {
    Error err;
    std::vector<ColumnDescriptor> columns = LoadColumns(table, &err);
    if (err.ok() && columns.empty()) {
      err.Set(ErrorCode::kError,
              "relation \"" + table + "\" does not exist");
    }
    if (err.ok()) { ApplyConstraints(table, &columns, &err); }
    if (err.ok()) { ApplyIndexes(table, &columns, &err); }

    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
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
    result.rows.reserve(static_cast<size_t>(q.NumRows()));
    while (!q.Eof()) {
      result.rows.push_back(RowFromCursor(q));
      q.NextRow();
    }
    return result;
  }

 private:
  static ColumnDescriptor* FindColumn(std::vector<ColumnDescriptor>* columns,
                                      const std::string& name) {
    for (auto& col : *columns) {
      if (col.name == name) { return &col; }
    }
    return nullptr;
  }

  std::vector<ColumnDescriptor> LoadColumns(const std::string& table,
                                            Error* err) {
    auto q = db_.ExecParams(
        "SELECT column_name, data_type, is_nullable, column_default, "
        "       character_maximum_length, is_identity "
        "FROM information_schema.columns "
        "WHERE table_schema = 'public' AND table_name = $1 "
        "ORDER BY ordinal_position",
        {table}, err);

    std::vector<ColumnDescriptor> columns;
    while (err->ok() && !q.Eof()) {
      ColumnDescriptor col;
      col.name = q.GetString("column_name");
      col.type = q.GetString("data_type");
      col.nullable = std::string(q.GetString("is_nullable")) == "YES";
      if (!q.FieldIsNull("column_default")) {
        col.default_value = std::string(q.GetString("column_default"));
      }
      if (!q.FieldIsNull("character_maximum_length")) {
        col.max_length =
            static_cast<int32_t>(q.GetInt64("character_maximum_length"));
      }
      bool identity = std::string(q.GetString("is_identity")) == "YES";
      bool serial = col.default_value.has_value() &&
                    col.default_value->compare(0, 8, "nextval(") == 0;
      if (identity || serial) { col.extra = std::string(kAutoIncrement); }
      columns.push_back(std::move(col));
      q.NextRow();
    }
    return columns;
  }

  void ApplyConstraints(const std::string& table,
                        std::vector<ColumnDescriptor>* columns, Error* err) {
    auto q = db_.ExecParams(
        "SELECT kcu.column_name, tc.constraint_type, "
        "       count(*) OVER (PARTITION BY tc.constraint_name) AS width "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name "
        " AND tc.table_schema = kcu.table_schema "
        " AND tc.table_name = kcu.table_name "
        "WHERE tc.table_schema = 'public' AND tc.table_name = $1 "
        "  AND tc.constraint_type IN ('PRIMARY KEY', 'UNIQUE')",
        {table}, err);

    while (err->ok() && !q.Eof()) {
      ColumnDescriptor* col = FindColumn(columns, q.GetString("column_name"));
      if (col != nullptr) {
        std::string kind = q.GetString("constraint_type");
        if (kind == "PRIMARY KEY") {
          col->is_primary_key = true;
        } else if (q.GetInt64("width") == 1) {
          col->is_unique = true;
        }
      }
      q.NextRow();
    }
  }

  /// INDEX on the leading column of every index that is neither the
  /// primary key nor a single-column unique index.
  void ApplyIndexes(const std::string& table,
                    std::vector<ColumnDescriptor>* columns, Error* err) {
    auto q = db_.ExecParams(
        "SELECT a.attname "
        "FROM pg_index i "
        "JOIN pg_class c ON c.oid = i.indrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum = i.indkey[0] "
        "WHERE n.nspname = 'public' AND c.relname = $1 "
        "  AND NOT i.indisprimary "
        "  AND (NOT i.indisunique OR i.indnatts > 1)",
        {table}, err);

    while (err->ok() && !q.Eof()) {
      ColumnDescriptor* col = FindColumn(columns, q.GetString(0));
      if (col != nullptr) { col->has_index = true; }
      q.NextRow();
    }
  }

  PgDb db_;
};

}  // namespace qbridge
