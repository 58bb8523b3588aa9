// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbridge::SchemaIntrospector.

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>

#include "fake_adapter.hpp"
#include "qbridge/schema_introspector.hpp"

using namespace qbridge;
using namespace qbridge::testing;

TEST_CASE("SchemaIntrospector: FormatColumn flag order",
          "[schema_introspector]") {
  ColumnDescriptor col;
  col.name = "id";
  col.type = "int(11)";
  col.is_primary_key = true;
  col.is_unique = true;
  col.has_index = true;
  col.extra = std::string("auto_increment");
  col.default_value = std::string("0");
  REQUIRE(SchemaIntrospector::FormatColumn(col) ==
          "  - id (int(11)) PRIMARY KEY UNIQUE INDEX AUTO_INCREMENT "
          "NOT NULL DEFAULT 0");
}

TEST_CASE("SchemaIntrospector: FormatColumn plain nullable column",
          "[schema_introspector]") {
  ColumnDescriptor col;
  col.name = "note";
  col.type = "TEXT";
  col.nullable = true;
  REQUIRE(SchemaIntrospector::FormatColumn(col) == "  - note (TEXT)");
}

TEST_CASE("SchemaIntrospector: FormatColumn max length",
          "[schema_introspector]") {
  ColumnDescriptor col;
  col.name = "code";
  col.type = "character varying";
  col.nullable = true;
  col.max_length = 8;
  REQUIRE(SchemaIntrospector::FormatColumn(col) ==
          "  - code (character varying(8))");

  // Already carries its length.
  col.type = "varchar(8)";
  REQUIRE(SchemaIntrospector::FormatColumn(col) == "  - code (varchar(8))");
}

TEST_CASE("SchemaIntrospector: other extras are not rendered",
          "[schema_introspector]") {
  ColumnDescriptor col;
  col.name = "updated";
  col.type = "timestamp";
  col.nullable = true;
  col.extra = std::string("on update CURRENT_TIMESTAMP");
  REQUIRE(SchemaIntrospector::FormatColumn(col) == "  - updated (timestamp)");
}

TEST_CASE("SchemaIntrospector: describe schema in catalog order",
          "[schema_introspector]") {
  auto state = std::make_shared<FakeState>();
  ConnectionRegistry registry(MakeFakeFactory(state));
  SchemaIntrospector introspector(registry);
  std::string id = registry.Open(BackendKind::kPostgres, FakeParams("app"));

  Error err;
  std::string text = introspector.DescribeSchema(id, &err);
  REQUIRE(err.ok());
  REQUIRE(text ==
          "Table: users\n"
          "Columns:\n"
          "  - id (INTEGER) PRIMARY KEY NOT NULL\n"
          "  - name (TEXT) UNIQUE\n"
          "\n"
          "Table: orders\n"
          "Columns:\n"
          "  - id (int) PRIMARY KEY AUTO_INCREMENT NOT NULL\n"
          "  - user_id (int) INDEX\n"
          "  - status (character varying(16)) NOT NULL DEFAULT 'new'\n"
          "\n");
}

TEST_CASE("SchemaIntrospector: one failing table fails the whole call",
          "[schema_introspector]") {
  auto state = std::make_shared<FakeState>();
  ConnectionRegistry registry(MakeFakeFactory(state));
  SchemaIntrospector introspector(registry);
  std::string id =
      registry.Open(BackendKind::kPostgres, FakeParams("partial"));

  Error err;
  std::string text = introspector.DescribeSchema(id, &err);
  REQUIRE(text.empty());
  REQUIRE(err.code == ErrorCode::kBackendError);
  REQUIRE(err.message == "no such table: ghost");
}

TEST_CASE("SchemaIntrospector: unknown id", "[schema_introspector]") {
  auto state = std::make_shared<FakeState>();
  ConnectionRegistry registry(MakeFakeFactory(state));
  SchemaIntrospector introspector(registry);

  Error err;
  introspector.DescribeSchema("conn-42", &err);
  REQUIRE(err.code == ErrorCode::kConnectionNotFound);
}

TEST_CASE("SchemaIntrospector: empty database", "[schema_introspector]") {
  auto state = std::make_shared<FakeState>();
  ConnectionRegistry registry(MakeFakeFactory(state));
  SchemaIntrospector introspector(registry);
  std::string id = registry.Open(BackendKind::kPostgres, FakeParams("blank"));

  Error err;
  REQUIRE(introspector.DescribeSchema(id, &err).empty());
  REQUIRE(err.ok());
}
