// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbridge::MariaAdapter (requires running MySQL/MariaDB server).
//
//   export QBRIDGE_MARIA_DSN="localhost:3306:root:pass:qbridge_test"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <string>
#include <vector>

#include "qbridge/client.hpp"
#include "qbridge/maria_adapter.hpp"

using namespace qbridge;

static ConnectParams GetParams() {
  return ParamsFromEnv("QBRIDGE_MARIA_DSN", "localhost:3306:root::qbridge_test");
}

static void Exec(MariaAdapter& adapter, const char* sql) {
  Error err;
  adapter.ExecuteQuery(sql, &err);
  REQUIRE(err.ok());
}

static void OpenTestDb(MariaAdapter& adapter) {
  Error err = adapter.Connect(GetParams());
  REQUIRE(err.ok());
  Exec(adapter, "DROP TABLE IF EXISTS qb_orders");
  Exec(adapter,
       "CREATE TABLE qb_orders("
       "id INT AUTO_INCREMENT PRIMARY KEY, "
       "code VARCHAR(16) NOT NULL UNIQUE, "
       "user_id INT, "
       "status VARCHAR(8) DEFAULT 'new', "
       "INDEX idx_qb_user(user_id))");
  Exec(adapter, "INSERT INTO qb_orders(code, user_id) VALUES('A1', 7)");
}

static bool Contains(const std::vector<std::string>& names,
                     const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

TEST_CASE("MariaAdapter: connect failure", "[mariadb_adapter]") {
  MariaAdapter adapter;
  ConnectParams params = GetParams();
  params.port = 1;
  params.connect_timeout_s = 2;
  Error err = adapter.Connect(params);
  REQUIRE(err.code == ErrorCode::kConnectFailed);
  REQUIRE_FALSE(err.message.empty());
  REQUIRE_FALSE(adapter.IsOpen());
}

TEST_CASE("MariaAdapter: catalog", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);

  Error err;
  auto dbs = adapter.ListDatabases(&err);
  REQUIRE(err.ok());
  REQUIRE(Contains(dbs, GetParams().database));
  REQUIRE(adapter.CurrentDatabase(&err) == GetParams().database);

  auto tables = adapter.ListTables(&err);
  REQUIRE(err.ok());
  REQUIRE(Contains(tables, "qb_orders"));
  REQUIRE_FALSE(Contains(tables, "user"));
}

TEST_CASE("MariaAdapter: describe table", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);

  Error err;
  auto cols = adapter.DescribeTable("qb_orders", &err);
  REQUIRE(err.ok());
  REQUIRE(cols.size() == 4);

  REQUIRE(cols[0].name == "id");
  REQUIRE(cols[0].is_primary_key);
  REQUIRE_FALSE(cols[0].nullable);
  REQUIRE(cols[0].extra.has_value());
  REQUIRE(*cols[0].extra == kAutoIncrement);

  REQUIRE(cols[1].name == "code");
  REQUIRE_FALSE(cols[1].is_primary_key);
  REQUIRE(cols[1].is_unique);

  REQUIRE(cols[2].name == "user_id");
  REQUIRE(cols[2].has_index);
  REQUIRE(cols[2].nullable);

  REQUIRE(cols[3].default_value.has_value());
  REQUIRE(*cols[3].default_value == "new");
}

TEST_CASE("MariaAdapter: describe missing table", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);

  Error err;
  REQUIRE(adapter.DescribeTable("qb_nope", &err).empty());
  REQUIRE(err.code == ErrorCode::kBackendError);
  REQUIRE(err.message.find("doesn't exist") != std::string::npos);
}

TEST_CASE("MariaAdapter: use database", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);
  REQUIRE(adapter.RebindsInPlace());

  REQUIRE(adapter.UseDatabase("information_schema").ok());
  Error err;
  REQUIRE(adapter.CurrentDatabase(&err) == "information_schema");

  Error use_err = adapter.UseDatabase("qb_no_such_database");
  REQUIRE(use_err.code == ErrorCode::kBackendError);
  REQUIRE(adapter.CurrentDatabase(&err) == "information_schema");
}

TEST_CASE("MariaAdapter: value types pass through", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);

  Error err;
  auto result = adapter.ExecuteQuery(
      "SELECT 1 AS one, 'x' AS s, 2.5e0 AS d, "
      "CAST(1.50 AS DECIMAL(4,2)) AS amount, NULL AS n",
      &err);
  REQUIRE(err.ok());
  REQUIRE(result.size() == 1);
  const Row& row = result.rows[0];
  REQUIRE(row.Find("one")->type() == Value::Type::kInteger);
  REQUIRE(row.Find("s")->AsString() == "x");
  REQUIRE(row.Find("d")->AsDouble() == Catch::Approx(2.5));
  REQUIRE(row.Find("amount")->AsString() == "1.50");
  REQUIRE(row.Find("n")->IsNull());
}

TEST_CASE("MariaAdapter: query results and errors", "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);

  Error err;
  auto rows = adapter.ExecuteQuery("SELECT * FROM qb_orders", &err);
  REQUIRE(err.ok());
  REQUIRE(rows.size() == 1);
  REQUIRE(rows.ColumnNames() ==
          std::vector<std::string>{"id", "code", "user_id", "status"});
  REQUIRE(rows.rows[0].Find("status")->AsString() == "new");

  auto none = adapter.ExecuteQuery("SELECT * FROM qb_orders WHERE id < 0",
                                   &err);
  REQUIRE(err.ok());
  REQUIRE(none.empty());

  adapter.ExecuteQuery("SELECT * FROM qb_nope", &err);
  REQUIRE(err.code == ErrorCode::kQueryFailed);
  REQUIRE(err.message.find("qb_nope") != std::string::npos);
}

TEST_CASE("MariaAdapter: stored procedure leaves the session usable",
          "[mariadb_adapter]") {
  MariaAdapter adapter;
  OpenTestDb(adapter);
  Exec(adapter, "DROP PROCEDURE IF EXISTS qb_two_results");
  Exec(adapter,
       "CREATE PROCEDURE qb_two_results() "
       "BEGIN SELECT code FROM qb_orders; SELECT 42 AS answer; END");

  Error err;
  auto first = adapter.ExecuteQuery("CALL qb_two_results()", &err);
  REQUIRE(err.ok());
  REQUIRE(first.size() == 1);
  REQUIRE(first.rows[0].Find("code")->AsString() == "A1");

  // Next statements run without "Commands out of sync".
  auto rows = adapter.ExecuteQuery("SELECT COUNT(*) AS n FROM qb_orders", &err);
  REQUIRE(err.ok());
  REQUIRE(rows.size() == 1);
  REQUIRE(adapter.CurrentDatabase(&err) == GetParams().database);
  REQUIRE(err.ok());

  Exec(adapter, "DROP PROCEDURE qb_two_results");
}

TEST_CASE("MariaAdapter: through the client", "[mariadb_adapter]") {
  Client client;
  Error err;
  std::string id = client.Open("mysql", GetParams(), &err);
  REQUIRE(err.ok());
  REQUIRE(client.Get(id).active_database == GetParams().database);

  REQUIRE(client.UseDatabase(id, "information_schema").ok());
  REQUIRE(client.Get(id).active_database == "information_schema");
  client.Close(id);

  client.ListTables(id, &err);
  REQUIRE(err.code == ErrorCode::kConnectionNotFound);
}
