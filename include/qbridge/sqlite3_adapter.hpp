// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Sqlite3Adapter -- embedded-file backend.
//
// Design:
//   - Owns one Sqlite3Db; ConnectParams::host is the file path
//   - A single pseudo-database "main"; UseDatabase() is a no-op
//   - Tables come from sqlite_master in creation order, keeping only what
//     PRAGMA table_list calls a plain "table" (no virtual tables, no FTS
//     shadow tables) and dropping the sqlite_ internal ones
//   - Columns come from PRAGMA table_info; UNIQUE / INDEX flags from
//     PRAGMA index_list + index_info; AUTOINCREMENT from the table's DDL

#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/sqlite3_db.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// Sqlite3Adapter
// ---------------------------------------------------------------------------

class Sqlite3Adapter : public Adapter {
 public:
  Sqlite3Adapter() = default;
  ~Sqlite3Adapter() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kSqlite3; }

  // --- Open / Close ---

  Error Connect(const ConnectParams& params) override {
    Error err = db_.Open(params.host.c_str());
    if (!err.ok()) {
      return Error::Make(ErrorCode::kConnectFailed, err.message);
    }
    if (params.connect_timeout_s > 0) {
      db_.SetBusyTimeout(params.connect_timeout_s * 1000);
    }
    return Error::Ok();
  }

  void Close() override { db_.Close(); }

  bool IsOpen() const override { return db_.IsOpen(); }

  // --- Catalog ---

  std::vector<std::string> ListDatabases(Error* out_error) override {
    if (!CheckOpen(out_error)) { return {}; }
    return {kSqliteMainDatabase};
  }

  Error UseDatabase(const std::string& /*name*/) override {
    return Error::Ok();
  }

  std::string CurrentDatabase(Error* out_error) override {
    if (!CheckOpen(out_error)) { return std::string(); }
    return kSqliteMainDatabase;
  }

  std::vector<std::string> ListTables(Error* out_error) override {
    Error err;
    auto q = db_.ExecQuery(
        "SELECT name FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
        "  AND name IN (SELECT name FROM pragma_table_list "
        "               WHERE schema = 'main' AND type = 'table');",
        &err);
    std::vector<std::string> tables;
    while (err.ok() && !q.Eof()) {
      tables.emplace_back(q.GetString(0));
      q.NextRow(&err);
    }
    if (!err.ok()) {
      Report(out_error, ErrorCode::kBackendError, err);
      return {};
    }
    return tables;
  }

  std::vector<ColumnDescriptor> DescribeTable(const std::string& table,
                                              Error* out_error) override {
    Error err;
    std::vector<ColumnDescriptor> columns;
    std::string quoted = QuoteIdentifier(table, '"');

    std::string sql = "PRAGMA table_info(" + quoted + ");";
    auto q = db_.ExecQuery(sql.c_str(), &err);
    while (err.ok() && !q.Eof()) {
      ColumnDescriptor col;
      col.name = q.GetString("name");
      col.type = q.GetString("type");
      col.nullable = q.GetInt64("notnull") == 0;
      // pk is the 1-based position inside the primary key, 0 otherwise.
      col.is_primary_key = q.GetInt64("pk") > 0;
      if (!q.FieldIsNull("dflt_value")) {
        col.default_value = std::string(q.GetString("dflt_value"));
      }
      columns.push_back(std::move(col));
      q.NextRow(&err);
    }
    q.Finalize();
    if (err.ok() && columns.empty()) {
      err.Set(ErrorCode::kError, "no such table: " + table);
    }
    if (err.ok()) { ApplyIndexes(quoted, &columns, &err); }
    if (err.ok()) { ApplyAutoIncrement(table, &columns, &err); }

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
    QueryResult result;
    auto q = db_.ExecQuery(sql.c_str(), &err);
    while (err.ok() && !q.Eof()) {
      result.rows.push_back(RowFromCursor(q));
      q.NextRow(&err);
    }
    if (!err.ok()) {
      Report(out_error, ErrorCode::kQueryFailed, err);
      return QueryResult{};
    }
    return result;
  }

 private:
  struct IndexEntry {
    std::string name;
    bool unique = false;
    bool partial = false;
  };

  bool CheckOpen(Error* out_error) const {
    if (db_.IsOpen()) { return true; }
    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kBackendError, "Database not open");
    }
    return false;
  }

  /// Mark UNIQUE on columns covered alone by a full unique index and
  /// INDEX on the leading column of any other secondary index. Indexes
  /// created for the primary key are skipped.
  void ApplyIndexes(const std::string& quoted_table,
                    std::vector<ColumnDescriptor>* columns, Error* err) {
    std::vector<IndexEntry> indexes;
    std::string sql = "PRAGMA index_list(" + quoted_table + ");";
    auto list = db_.ExecQuery(sql.c_str(), err);
    while (err->ok() && !list.Eof()) {
      if (std::string(list.GetString("origin")) != "pk") {
        IndexEntry entry;
        entry.name = list.GetString("name");
        entry.unique = list.GetInt64("unique") != 0;
        entry.partial = list.GetInt64("partial") != 0;
        indexes.push_back(std::move(entry));
      }
      list.NextRow(err);
    }
    list.Finalize();

    for (const auto& index : indexes) {
      if (!err->ok()) { return; }
      std::vector<std::string> index_columns;
      std::string info_sql =
          "PRAGMA index_info(" + QuoteIdentifier(index.name, '"') + ");";
      auto info = db_.ExecQuery(info_sql.c_str(), err);
      while (err->ok() && !info.Eof()) {
        // Expression index terms have a NULL name.
        index_columns.emplace_back(info.GetString("name"));
        info.NextRow(err);
      }
      if (index_columns.empty() || index_columns.front().empty()) {
        continue;
      }

      bool sole_unique =
          index.unique && !index.partial && index_columns.size() == 1;
      for (auto& col : *columns) {
        if (col.name != index_columns.front()) { continue; }
        if (sole_unique) {
          col.is_unique = true;
        } else {
          col.has_index = true;
        }
      }
    }
  }

  /// AUTOINCREMENT is only legal on the INTEGER PRIMARY KEY column, and
  /// SQLite keeps no flag for it outside the CREATE TABLE text.
  void ApplyAutoIncrement(const std::string& table,
                          std::vector<ColumnDescriptor>* columns,
                          Error* err) {
    ColumnDescriptor* rowid_alias = nullptr;
    int32_t pk_count = 0;
    for (auto& col : *columns) {
      if (!col.is_primary_key) { continue; }
      ++pk_count;
      rowid_alias = &col;
    }
    if (pk_count != 1 || UpperCase(rowid_alias->type) != "INTEGER") {
      return;
    }

    std::string sql =
        "SELECT sql FROM sqlite_master WHERE type = 'table' AND name = " +
        QuoteIdentifier(table, '\'') + ";";
    auto q = db_.ExecQuery(sql.c_str(), err);
    if (!err->ok() || q.Eof() || q.FieldIsNull(0)) { return; }
    if (UpperCase(q.GetString(0)).find("AUTOINCREMENT") != std::string::npos) {
      rowid_alias->extra = std::string(kAutoIncrement);
    }
  }

  static std::string UpperCase(std::string text) {
    for (auto& ch : text) {
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return text;
  }

  Sqlite3Db db_;
};

}  // namespace qbridge
