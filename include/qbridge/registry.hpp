// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::ConnectionRegistry -- owns every open connection.
//
// Design:
//   - Maps an opaque id ("conn-<n>", never reused) to one Entry holding
//     the backend kind, the parameters it was opened with, the adapter
//     and the active database name
//   - The map has its own mutex; each Entry has a mutex held for the
//     whole of every operation on that id, so operations on one id run
//     one at a time while distinct ids proceed independently
//   - Switching database on a backend that cannot rebind builds a new
//     adapter first, then closes the old one and installs the new one;
//     a failed connect leaves the entry exactly as it was
//   - Close() is idempotent; the destructor closes everything still open
//   - No exception leaves a public operation
//
// Usage:
//   qbridge::ConnectionRegistry registry;
//   qbridge::Error err;
//   std::string id = registry.Open(qbridge::BackendKind::kSqlite3,
//                                  params, &err);
//   auto tables = registry.ListTables(id, &err);
//   registry.Close(id);

#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "qbridge/adapter.hpp"
#include "qbridge/config.hpp"
#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/sqlite3_adapter.hpp"
#include "qbridge/types.hpp"

#if defined(QBRIDGE_HAS_MARIADB) && QBRIDGE_HAS_MARIADB
#include "qbridge/maria_adapter.hpp"
#endif

#if defined(QBRIDGE_HAS_POSTGRESQL) && QBRIDGE_HAS_POSTGRESQL
#include "qbridge/pg_adapter.hpp"
#endif

namespace qbridge {

/// Adapter for every backend compiled into this build.
inline std::unique_ptr<Adapter> MakeDefaultAdapter(BackendKind kind) {
  switch (kind) {
    case BackendKind::kSqlite3:
      return std::make_unique<Sqlite3Adapter>();
#if defined(QBRIDGE_HAS_MARIADB) && QBRIDGE_HAS_MARIADB
    case BackendKind::kMariaDb:
      return std::make_unique<MariaAdapter>();
#endif
#if defined(QBRIDGE_HAS_POSTGRESQL) && QBRIDGE_HAS_POSTGRESQL
    case BackendKind::kPostgres:
      return std::make_unique<PgAdapter>();
#endif
    default:
      return nullptr;
  }
}

// ---------------------------------------------------------------------------
// ConnectionRegistry
// ---------------------------------------------------------------------------

class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(AdapterFactory factory = MakeDefaultAdapter)
      : factory_(std::move(factory)) {}

  ~ConnectionRegistry() { CloseAll(); }

  // No copy, no move: entries are addressed by id only.
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // --- Open / Close ---

  /// Connect through the adapter for `kind`. Returns the new id, or an
  /// empty string with kUnsupportedBackend / kConnectFailed.
  std::string Open(BackendKind kind, const ConnectParams& params,
                   Error* out_error = nullptr) {
    std::unique_ptr<Adapter> adapter;
    std::string id;
    std::string active_database;
    Error err = Guard([&]() -> Error {
      adapter = factory_ ? factory_(kind) : nullptr;
      if (adapter == nullptr) {
        return Error::Make(ErrorCode::kUnsupportedBackend,
                           std::string("Unsupported database type: ") +
                               BackendKindName(kind));
      }
      Error connect_err = adapter->Connect(params);
      if (!connect_err.ok()) {
        return Error::Make(ErrorCode::kConnectFailed, connect_err.message);
      }

      auto entry = std::make_shared<Entry>();
      entry->kind = kind;
      entry->params = params;
      entry->active_database = QueryActiveDatabase(*adapter, params.database);
      active_database = entry->active_database;
      entry->adapter = std::move(adapter);

      std::lock_guard<std::mutex> lock(mutex_);
      std::string new_id = "conn-" + std::to_string(next_id_++);
      entries_[new_id] = entry;
      id = std::move(new_id);
      return Error::Ok();
    });
    if (!err.ok()) {
      // Connected but never registered: release the session now.
      if (adapter != nullptr) { adapter->Close(); }
      Log().warn("open {} failed: {}", BackendKindName(kind), err.message);
      Report(out_error, err);
      return std::string();
    }

    Log().info("{}: opened {} {} (database '{}')", id, BackendKindName(kind),
               params.host, active_database);
    return id;
  }

  /// Same as above with the backend given by name ("mysql", "postgresql",
  /// "sqlite", ...).
  std::string Open(const char* backend_name, const ConnectParams& params,
                   Error* out_error = nullptr) {
    BackendKind kind;
    if (!ParseBackendKind(backend_name, &kind)) {
      Error err = Error::Make(
          ErrorCode::kUnsupportedBackend,
          std::string("Unsupported database type: ") +
              (backend_name != nullptr ? backend_name : "(null)"));
      Log().warn("open failed: {}", err.message);
      Report(out_error, err);
      return std::string();
    }
    return Open(kind, params, out_error);
  }

  /// Release the native session and forget `id`. Unknown or already
  /// closed ids succeed silently. Waits for an in-flight operation on the
  /// same id to finish first.
  void Close(const std::string& id) {
    std::shared_ptr<Entry> entry = Find(id);
    if (entry == nullptr) { return; }

    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      if (entry->adapter != nullptr) {
        entry->adapter->Close();
        entry->adapter.reset();
        Log().info("{}: closed", id);
      }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end() && it->second == entry) {
      entries_.erase(it);
    }
  }

  /// Close every open connection.
  void CloseAll() {
    std::map<std::string, std::shared_ptr<Entry>> entries;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      entries.swap(entries_);
    }
    for (auto& kv : entries) {
      std::lock_guard<std::mutex> lock(kv.second->mutex);
      if (kv.second->adapter != nullptr) {
        kv.second->adapter->Close();
        kv.second->adapter.reset();
        Log().info("{}: closed", kv.first);
      }
    }
  }

  // --- Lookup ---

  HandleInfo Get(const std::string& id, Error* out_error = nullptr) {
    HandleInfo info;
    Error err = WithEntry(id, [&](Entry& entry) {
      info.id = id;
      info.kind = entry.kind;
      info.active_database = entry.active_database;
      return Error::Ok();
    });
    if (!err.ok()) {
      Report(out_error, err);
      return HandleInfo{};
    }
    return info;
  }

  bool Contains(const std::string& id) const { return Find(id) != nullptr; }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  // --- Catalog ---

  std::vector<std::string> ListDatabases(const std::string& id,
                                         Error* out_error = nullptr) {
    std::vector<std::string> names;
    Error err = WithAdapter(id, [&](Adapter& adapter) {
      Error list_err;
      names = adapter.ListDatabases(&list_err);
      return list_err;
    });
    return Finish(id, "list databases", err, out_error, std::move(names));
  }

  /// Select database `name` for `id`. On a backend that cannot rebind,
  /// the session is replaced; if the new session cannot be opened the
  /// old one stays in place and keeps working.
  Error UseDatabase(const std::string& id, const std::string& name) {
    Error err = WithEntry(id, [&](Entry& entry) {
      if (entry.adapter->RebindsInPlace()) {
        Error use_err = entry.adapter->UseDatabase(name);
        if (!use_err.ok()) { return use_err; }
        entry.active_database = QueryActiveDatabase(*entry.adapter, name);
        entry.params.database = name;
        return Error::Ok();
      }
      return ReplaceSession(id, &entry, name);
    });
    if (!err.ok()) {
      Log().warn("{}: use database '{}' failed: {}", id, name, err.message);
      return err;
    }
    Log().info("{}: using database '{}'", id, name);
    return Error::Ok();
  }

  /// Database the backend reports as selected; empty when none is.
  std::string CurrentDatabase(const std::string& id,
                              Error* out_error = nullptr) {
    std::string name;
    Error err = WithAdapter(id, [&](Adapter& adapter) {
      Error db_err;
      name = adapter.CurrentDatabase(&db_err);
      return db_err;
    });
    return Finish(id, "current database", err, out_error, std::move(name));
  }

  std::vector<std::string> ListTables(const std::string& id,
                                      Error* out_error = nullptr) {
    std::vector<std::string> tables;
    Error err = WithAdapter(id, [&](Adapter& adapter) {
      Error list_err;
      tables = adapter.ListTables(&list_err);
      return list_err;
    });
    return Finish(id, "list tables", err, out_error, std::move(tables));
  }

  std::vector<ColumnDescriptor> DescribeTable(const std::string& id,
                                              const std::string& table,
                                              Error* out_error = nullptr) {
    std::vector<ColumnDescriptor> columns;
    Error err = WithAdapter(id, [&](Adapter& adapter) {
      Error describe_err;
      columns = adapter.DescribeTable(table, &describe_err);
      return describe_err;
    });
    return Finish(id, "describe table", err, out_error, std::move(columns));
  }

  // --- Access for the executor and introspector ---

  /// Run `fn(Adapter&) -> Error` while holding the lock for `id`.
  /// Returns kConnectionNotFound when `id` is not open.
  template <typename Fn>
  Error WithAdapter(const std::string& id, Fn&& fn) {
    return WithEntry(id, [&fn](Entry& entry) { return fn(*entry.adapter); });
  }

 private:
  struct Entry {
    std::mutex mutex;
    BackendKind kind = BackendKind::kSqlite3;
    ConnectParams params;
    std::unique_ptr<Adapter> adapter;  // null once closed
    std::string active_database;
  };

  static Error NotFound(const std::string& id) {
    return Error::Make(ErrorCode::kConnectionNotFound,
                       "Database connection not found: " + id);
  }

  /// Convert exceptions escaping adapter or allocator code into kError.
  template <typename Fn>
  static Error Guard(Fn&& fn) {
    try {
      return fn();
    } catch (const std::exception& e) {
      return Error::Make(ErrorCode::kError, e.what());
    }
  }

  static std::string QueryActiveDatabase(Adapter& adapter,
                                         const std::string& fallback) {
    Error err;
    std::string name = adapter.CurrentDatabase(&err);
    if (!err.ok()) {
      Log().debug("current database unavailable: {}", err.message);
      return fallback;
    }
    return name;
  }

  template <typename T>
  static T Finish(const std::string& id, const char* what, const Error& err,
                  Error* out_error, T value) {
    if (!err.ok()) {
      Log().warn("{}: {} failed: {}", id, what, err.message);
      Report(out_error, err);
      return T{};
    }
    return value;
  }

  std::shared_ptr<Entry> Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return (it != entries_.end()) ? it->second : nullptr;
  }

  template <typename Fn>
  Error WithEntry(const std::string& id, Fn&& fn) {
    std::shared_ptr<Entry> entry = Find(id);
    if (entry == nullptr) { return NotFound(id); }

    std::lock_guard<std::mutex> lock(entry->mutex);
    // Closed while this call was waiting for the lock.
    if (entry->adapter == nullptr) { return NotFound(id); }
    return Guard([&]() { return fn(*entry); });
  }

  /// Open a session on `name`, then release the old one and install the
  /// new one. Called with the entry lock held.
  Error ReplaceSession(const std::string& id, Entry* entry,
                       const std::string& name) {
    ConnectParams params = entry->params;
    params.database = name;

    std::unique_ptr<Adapter> fresh = factory_(entry->kind);
    if (fresh == nullptr) {
      return Error::Make(ErrorCode::kUnsupportedBackend,
                         std::string("Unsupported database type: ") +
                             BackendKindName(entry->kind));
    }
    Error err = fresh->Connect(params);
    if (!err.ok()) {
      return Error::Make(ErrorCode::kBackendError, err.message);
    }

    std::unique_ptr<Adapter> old = std::move(entry->adapter);
    old->Close();
    entry->adapter = std::move(fresh);
    entry->params = params;
    entry->active_database = QueryActiveDatabase(*entry->adapter, name);
    Log().debug("{}: session replaced for database '{}'", id, name);
    return Error::Ok();
  }

  AdapterFactory factory_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
  uint64_t next_id_ = 1;
};

}  // namespace qbridge
