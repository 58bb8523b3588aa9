// Copyright (c) 2024 liudegui. MIT License.
// Tests for qbridge::Value, Row and QueryResult.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "qbridge/value.hpp"

using namespace qbridge;

TEST_CASE("Value: default is null", "[value]") {
  Value v;
  REQUIRE(v.IsNull());
  REQUIRE(v.type() == Value::Type::kNull);
  REQUIRE(v.ToString() == "NULL");
  REQUIRE(v.AsInt64(-1) == -1);
  REQUIRE(v == Value::Null());
}

TEST_CASE("Value: numbers keep their kind", "[value]") {
  Value i = Value::Integer(42);
  Value r = Value::Real(2.5);
  REQUIRE(i.IsNumber());
  REQUIRE(r.IsNumber());
  REQUIRE(i.type() == Value::Type::kInteger);
  REQUIRE(r.type() == Value::Type::kReal);
  REQUIRE(i.AsInt64() == 42);
  REQUIRE(i.AsDouble() == Catch::Approx(42.0));
  REQUIRE(r.AsDouble() == Catch::Approx(2.5));
  REQUIRE(i.ToString() == "42");
  REQUIRE(r.ToString() == "2.5");
}

TEST_CASE("Value: text is not coerced", "[value]") {
  Value t = Value::Text("42");
  REQUIRE_FALSE(t.IsNumber());
  REQUIRE(t.AsString() == "42");
  REQUIRE(t != Value::Integer(42));
}

TEST_CASE("Value: bool and blob", "[value]") {
  Value b = Value::Bool(true);
  REQUIRE(b.type() == Value::Type::kBool);
  REQUIRE(b.AsBool());
  REQUIRE(b.ToString() == "true");
  REQUIRE_FALSE(b.IsNumber());

  Value blob = Value::Blob(std::string("\x01\x00\x02", 3));
  REQUIRE(blob.type() == Value::Type::kBlob);
  REQUIRE(blob.AsString().size() == 3);
  REQUIRE(blob != Value::Text(std::string("\x01\x00\x02", 3)));
}

TEST_CASE("Row: keeps column order and replaces duplicates", "[value]") {
  Row row;
  row.Set("id", Value::Integer(1));
  row.Set("name", Value::Text("Alice"));
  row.Set("id", Value::Integer(7));

  REQUIRE(row.size() == 2);
  REQUIRE(row.Fields()[0].first == "id");
  REQUIRE(row.Fields()[1].first == "name");
  REQUIRE(row.Find("id")->AsInt64() == 7);
  REQUIRE(row.Find("missing") == nullptr);
}

TEST_CASE("QueryResult: column names from first row", "[value]") {
  QueryResult empty;
  REQUIRE(empty.empty());
  REQUIRE(empty.ColumnNames().empty());

  QueryResult result;
  Row row;
  row.Set("b", Value::Integer(1));
  row.Set("a", Value::Null());
  result.rows.push_back(row);

  auto names = result.ColumnNames();
  REQUIRE(names.size() == 2);
  REQUIRE(names[0] == "b");
  REQUIRE(names[1] == "a");
}
