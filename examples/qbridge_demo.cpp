// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge demo -- open a backend, walk its catalog, print the schema text
// and run a query.
//
// Usage:
//   ./qbridge_demo                                   # in-memory SQLite
//   ./qbridge_demo sqlite ./app.db
//   ./qbridge_demo mysql "localhost:3306:root:pass:qbridge_test"
//   ./qbridge_demo postgresql "localhost:5432:postgres:pass:qbridge_test"
//
// QBRIDGE_LOG_LEVEL=debug shows every statement sent to the backend.

#include <cstdio>
#include <string>

#include "qbridge/client.hpp"

static void PrintResult(const qbridge::QueryResult& result) {
  auto names = result.ColumnNames();
  for (const auto& name : names) { std::printf("  %-12s", name.c_str()); }
  std::printf("\n");
  for (const auto& row : result.rows) {
    for (const auto& field : row) {
      std::printf("  %-12s", field.second.ToString().c_str());
    }
    std::printf("\n");
  }
  std::printf("(%zu row%s)\n", result.size(), result.size() == 1 ? "" : "s");
}

int main(int argc, char* argv[]) {
  qbridge::InitLogging(qbridge::LogLevelFromEnv());

  const char* backend = (argc > 1) ? argv[1] : "sqlite";
  const char* dsn = (argc > 2) ? argv[2] : ":memory:";

  qbridge::Client client;
  qbridge::Error err;

  qbridge::ConnectParams params =
      qbridge::ParamsForBackend(backend, dsn, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Bad DSN: %s\n", err.message.c_str());
    return 1;
  }
  std::string id = client.Open(backend, params, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed [%s]: %s\n",
                 qbridge::ErrorCodeName(err.code), err.message.c_str());
    return 1;
  }
  qbridge::HandleInfo info = client.Get(id);
  std::printf("Connected to %s as %s (database '%s')\n",
              qbridge::BackendKindName(info.kind), id.c_str(),
              info.active_database.c_str());

  // Seed a table so an empty in-memory database has something to show.
  if (info.kind == qbridge::BackendKind::kSqlite3) {
    client.ExecuteQuery(id,
                        "CREATE TABLE IF NOT EXISTS emp("
                        "empno INTEGER PRIMARY KEY, "
                        "empname TEXT NOT NULL UNIQUE, "
                        "dept TEXT DEFAULT 'sales');",
                        &err);
    client.ExecuteQuery(id,
                        "INSERT OR IGNORE INTO emp(empno, empname) "
                        "VALUES(1, 'Alice');",
                        &err);
    client.ExecuteQuery(id,
                        "INSERT OR IGNORE INTO emp(empno, empname) "
                        "VALUES(2, 'Bob');",
                        &err);
    if (!err.ok()) {
      std::fprintf(stderr, "Seed failed: %s\n", err.message.c_str());
      return 1;
    }
  }

  std::printf("\n--- Databases ---\n");
  for (const auto& name : client.ListDatabases(id, &err)) {
    std::printf("  %s\n", name.c_str());
  }
  if (!err.ok()) { std::fprintf(stderr, "%s\n", err.message.c_str()); }

  err.Clear();
  auto tables = client.ListTables(id, &err);
  std::printf("\n--- Tables ---\n");
  for (const auto& name : tables) { std::printf("  %s\n", name.c_str()); }
  if (!err.ok()) { std::fprintf(stderr, "%s\n", err.message.c_str()); }

  err.Clear();
  std::string schema = client.DescribeSchema(id, &err);
  std::printf("\n--- Schema ---\n");
  if (err.ok()) {
    std::printf("%s", schema.c_str());
  } else {
    std::fprintf(stderr, "%s\n", err.message.c_str());
  }

  if (!tables.empty()) {
    std::string sql = "SELECT * FROM " + tables.front();
    std::printf("--- %s ---\n", sql.c_str());
    err.Clear();
    auto result = client.ExecuteQuery(id, sql, &err);
    if (err.ok()) {
      PrintResult(result);
    } else {
      std::fprintf(stderr, "Query failed: %s\n", err.message.c_str());
    }
  }

  client.Close(id);
  std::printf("\nDone.\n");
  return 0;
}
