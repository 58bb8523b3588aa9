// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::SchemaIntrospector -- one text document describing every base
// table of a connection's current database.
//
// Format, one block per table in ListTables() order:
//
//   Table: users
//   Columns:
//     - id (INTEGER) PRIMARY KEY NOT NULL
//     - name (varchar(64)) UNIQUE DEFAULT 'x'
//   <blank line>
//
// The connection lock is held for the whole walk, so a concurrent
// UseDatabase() cannot switch databases between two tables.

#pragma once

#include <string>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/registry.hpp"
#include "qbridge/types.hpp"

namespace qbridge {

class SchemaIntrospector {
 public:
  explicit SchemaIntrospector(ConnectionRegistry& registry)
      : registry_(registry) {}

  /// Describe all tables of `id`. Any table that cannot be described
  /// fails the whole call with that table's error.
  std::string DescribeSchema(const std::string& id,
                             Error* out_error = nullptr) {
    std::string text;
    Error err = registry_.WithAdapter(id, [&](Adapter& adapter) {
      Error step;
      std::vector<std::string> tables = adapter.ListTables(&step);
      if (!step.ok()) { return step; }
      for (const auto& table : tables) {
        std::vector<ColumnDescriptor> columns =
            adapter.DescribeTable(table, &step);
        if (!step.ok()) { return step; }
        AppendTable(table, columns, &text);
      }
      return Error::Ok();
    });
    if (!err.ok()) {
      Log().warn("{}: describe schema failed: {}", id, err.message);
      Report(out_error, err);
      return std::string();
    }
    return text;
  }

  static void AppendTable(const std::string& table,
                          const std::vector<ColumnDescriptor>& columns,
                          std::string* out) {
    out->append("Table: ").append(table).append("\nColumns:\n");
    for (const auto& col : columns) {
      out->append(FormatColumn(col)).push_back('\n');
    }
    out->push_back('\n');
  }

  /// "  - name (type) FLAGS..." without the trailing newline.
  static std::string FormatColumn(const ColumnDescriptor& col) {
    std::string line = "  - " + col.name + " (" + col.type;
    if (col.max_length && col.type.find('(') == std::string::npos) {
      line += "(" + std::to_string(*col.max_length) + ")";
    }
    line += ")";
    if (col.is_primary_key) { line += " PRIMARY KEY"; }
    if (col.is_unique) { line += " UNIQUE"; }
    if (col.has_index) { line += " INDEX"; }
    if (col.extra && *col.extra == kAutoIncrement) { line += " AUTO_INCREMENT"; }
    if (!col.nullable) { line += " NOT NULL"; }
    if (col.default_value) { line += " DEFAULT " + *col.default_value; }
    return line;
  }

 private:
  ConnectionRegistry& registry_;
};

}  // namespace qbridge
