// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Client -- the caller-facing entry point.
//
// Design:
//   - Owns one ConnectionRegistry and the executor/introspector built on
//     it; construct once at startup, destroy at shutdown (closes every
//     connection still open)
//   - Every operation returns its payload and reports failures through
//     Error*, or returns Error directly; nothing throws
//   - Safe to call from several threads; calls on one id are serialized
//   - Users include this single header
//
// Usage:
//   #include "qbridge/client.hpp"
//   qbridge::Client client;
//   qbridge::ConnectParams params;
//   params.host = "./app.db";
//   qbridge::Error err;
//   std::string id = client.Open("sqlite", params, &err);
//   auto result = client.ExecuteQuery(id, "SELECT * FROM users;", &err);
//   client.Close(id);
//
// MariaDB/MySQL needs QBRIDGE_HAS_MARIADB=1, PostgreSQL needs
// QBRIDGE_HAS_POSTGRESQL=1; otherwise Open() fails with
// kUnsupportedBackend for those kinds.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/config.hpp"
#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/query_executor.hpp"
#include "qbridge/registry.hpp"
#include "qbridge/schema_introspector.hpp"
#include "qbridge/types.hpp"
#include "qbridge/value.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// Client
// ---------------------------------------------------------------------------

class Client {
 public:
  explicit Client(AdapterFactory factory = MakeDefaultAdapter)
      : registry_(std::move(factory)),
        executor_(registry_),
        introspector_(registry_) {}

  // No copy, no move: the executor and introspector refer to registry_.
  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // --- Open / Close ---

  std::string Open(BackendKind kind, const ConnectParams& params,
                   Error* out_error = nullptr) {
    return registry_.Open(kind, params, out_error);
  }

  std::string Open(const char* backend_name, const ConnectParams& params,
                   Error* out_error = nullptr) {
    return registry_.Open(backend_name, params, out_error);
  }

  void Close(const std::string& id) { registry_.Close(id); }
  void CloseAll() { registry_.CloseAll(); }

  // --- Lookup ---

  HandleInfo Get(const std::string& id, Error* out_error = nullptr) {
    return registry_.Get(id, out_error);
  }
  bool Contains(const std::string& id) const { return registry_.Contains(id); }
  size_t Size() const { return registry_.Size(); }

  // --- Catalog ---

  std::vector<std::string> ListDatabases(const std::string& id,
                                         Error* out_error = nullptr) {
    return registry_.ListDatabases(id, out_error);
  }

  Error UseDatabase(const std::string& id, const std::string& name) {
    return registry_.UseDatabase(id, name);
  }

  std::string CurrentDatabase(const std::string& id,
                              Error* out_error = nullptr) {
    return registry_.CurrentDatabase(id, out_error);
  }

  std::vector<std::string> ListTables(const std::string& id,
                                      Error* out_error = nullptr) {
    return registry_.ListTables(id, out_error);
  }

  std::vector<ColumnDescriptor> DescribeTable(const std::string& id,
                                              const std::string& table,
                                              Error* out_error = nullptr) {
    return registry_.DescribeTable(id, table, out_error);
  }

  std::string DescribeSchema(const std::string& id,
                             Error* out_error = nullptr) {
    return introspector_.DescribeSchema(id, out_error);
  }

  // --- Query ---

  QueryResult ExecuteQuery(const std::string& id, const std::string& sql,
                           Error* out_error = nullptr) {
    return executor_.Execute(id, sql, out_error);
  }

 private:
  ConnectionRegistry registry_;
  QueryExecutor executor_;
  SchemaIntrospector introspector_;
};

}  // namespace qbridge
