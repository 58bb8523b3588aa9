// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Value / Row / QueryResult -- normalized query results.
//
// Design:
//   - Value is a small tagged value: null, integer, real, text, bool, blob
//   - Adapters fill values with the type the native driver reports, no
//     coercion between numeric and string forms
//   - Row keeps column order as reported by the backend; a repeated
//     column name overwrites the earlier value in place
//   - QueryResult derives display column order from the first row

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace qbridge {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

class Value {
 public:
  enum class Type : int32_t {
    kNull = 0,
    kInteger,
    kReal,
    kText,
    kBool,
    kBlob,
  };

  Value() = default;

  static Value Null() { return Value{}; }

  static Value Integer(int64_t v) {
    Value out;
    out.type_ = Type::kInteger;
    out.int_ = v;
    return out;
  }

  static Value Real(double v) {
    Value out;
    out.type_ = Type::kReal;
    out.real_ = v;
    return out;
  }

  static Value Text(std::string v) {
    Value out;
    out.type_ = Type::kText;
    out.text_ = std::move(v);
    return out;
  }

  static Value Bool(bool v) {
    Value out;
    out.type_ = Type::kBool;
    out.int_ = v ? 1 : 0;
    return out;
  }

  static Value Blob(std::string bytes) {
    Value out;
    out.type_ = Type::kBlob;
    out.text_ = std::move(bytes);
    return out;
  }

  Type type() const { return type_; }
  bool IsNull() const { return type_ == Type::kNull; }
  bool IsNumber() const {
    return type_ == Type::kInteger || type_ == Type::kReal;
  }

  // --- Typed accessors ---

  int64_t AsInt64(int64_t null_value = 0) const {
    switch (type_) {
      case Type::kInteger:
      case Type::kBool:    return int_;
      case Type::kReal:    return static_cast<int64_t>(real_);
      default:             return null_value;
    }
  }

  double AsDouble(double null_value = 0.0) const {
    switch (type_) {
      case Type::kInteger: return static_cast<double>(int_);
      case Type::kReal:    return real_;
      default:             return null_value;
    }
  }

  bool AsBool(bool null_value = false) const {
    switch (type_) {
      case Type::kBool:
      case Type::kInteger: return int_ != 0;
      default:             return null_value;
    }
  }

  /// Raw bytes for text and blob values, empty otherwise.
  const std::string& AsString() const { return text_; }

  /// Display form. Null renders as "NULL".
  std::string ToString() const {
    switch (type_) {
      case Type::kNull:    return "NULL";
      case Type::kInteger: return std::to_string(int_);
      case Type::kBool:    return int_ != 0 ? "true" : "false";
      case Type::kReal: {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.17g", real_);
        return buf;
      }
      case Type::kText:
      case Type::kBlob:    return text_;
    }
    return std::string();
  }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case Type::kNull:    return true;
      case Type::kInteger:
      case Type::kBool:    return int_ == other.int_;
      case Type::kReal:    return real_ == other.real_;
      case Type::kText:
      case Type::kBlob:    return text_ == other.text_;
    }
    return false;
  }

  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  Type type_ = Type::kNull;
  int64_t int_ = 0;
  double real_ = 0.0;
  std::string text_;
};

// ---------------------------------------------------------------------------
// Row
// ---------------------------------------------------------------------------

class Row {
 public:
  using Field = std::pair<std::string, Value>;

  void Set(const std::string& name, Value value) {
    for (auto& field : fields_) {
      if (field.first == name) {
        field.second = std::move(value);
        return;
      }
    }
    fields_.emplace_back(name, std::move(value));
  }

  /// nullptr when the row has no such column.
  const Value* Find(const std::string& name) const {
    for (const auto& field : fields_) {
      if (field.first == name) { return &field.second; }
    }
    return nullptr;
  }

  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  const std::vector<Field>& Fields() const { return fields_; }
  std::vector<Field>::const_iterator begin() const { return fields_.begin(); }
  std::vector<Field>::const_iterator end() const { return fields_.end(); }

 private:
  std::vector<Field> fields_;
};

// ---------------------------------------------------------------------------
// QueryResult
// ---------------------------------------------------------------------------

struct QueryResult {
  std::vector<Row> rows;

  bool empty() const { return rows.empty(); }
  size_t size() const { return rows.size(); }

  /// Column names in the first row's order; empty for zero rows.
  std::vector<std::string> ColumnNames() const {
    std::vector<std::string> names;
    if (rows.empty()) { return names; }
    names.reserve(rows.front().size());
    for (const auto& field : rows.front()) {
      names.push_back(field.first);
    }
    return names;
  }
};

}  // namespace qbridge
