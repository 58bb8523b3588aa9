// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge core types -- backend kinds, connection parameters, column
// descriptors and handle snapshots.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace qbridge {

// ---------------------------------------------------------------------------
// BackendKind
// ---------------------------------------------------------------------------

enum class BackendKind : int32_t {
  kMariaDb = 0,   // MySQL family, rebinds the session in place
  kPostgres = 1,  // needs a new session per database
  kSqlite3 = 2,   // embedded file, single pseudo-database
};

inline const char* BackendKindName(BackendKind kind) {
  switch (kind) {
    case BackendKind::kMariaDb:  return "mysql";
    case BackendKind::kPostgres: return "postgresql";
    case BackendKind::kSqlite3:  return "sqlite";
  }
  return "unknown";
}

/// Database name reported by the embedded-file backend.
constexpr const char* kSqliteMainDatabase = "main";

/// Marker stored in ColumnDescriptor::extra for auto-assigned keys.
constexpr const char* kAutoIncrement = "auto_increment";

// ---------------------------------------------------------------------------
// ConnectParams
// ---------------------------------------------------------------------------

struct ConnectParams {
  std::string host;        // file path for the embedded-file backend
  uint16_t port = 0;       // 0 selects the backend default
  std::string user;
  std::string password;
  std::string database;    // empty: server default
  int32_t connect_timeout_s = 10;
};

// ---------------------------------------------------------------------------
// ColumnDescriptor
// ---------------------------------------------------------------------------

struct ColumnDescriptor {
  std::string name;
  std::string type;  // backend-native type string
  bool nullable = false;
  bool is_primary_key = false;
  bool is_unique = false;
  bool has_index = false;
  std::optional<std::string> default_value;
  std::optional<std::string> extra;
  std::optional<int32_t> max_length;
};

// ---------------------------------------------------------------------------
// HandleInfo -- snapshot of a registry entry
// ---------------------------------------------------------------------------

struct HandleInfo {
  std::string id;
  BackendKind kind = BackendKind::kSqlite3;
  std::string active_database;
};

}  // namespace qbridge
