// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Adapter -- the capability set every backend implements.
//
// Design:
//   - One abstract interface, one implementation per backend, chosen once
//     when a connection is opened and fixed for its lifetime
//   - Each adapter exclusively owns one native session (Sqlite3Db,
//     MariaDb, PgDb); nothing else keeps a reference to it
//   - Payload-returning operations report failures through Error*, the
//     way the native wrappers do; adapters never throw
//   - Error codes are already the public taxonomy: kConnectFailed,
//     kBackendError (catalog work) and kQueryFailed (ExecuteQuery), with
//     the backend's message unchanged
//   - Adapters are not thread-safe; the registry serializes access

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "qbridge/error.hpp"
#include "qbridge/types.hpp"
#include "qbridge/value.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// Adapter
// ---------------------------------------------------------------------------

class Adapter {
 public:
  Adapter() = default;
  virtual ~Adapter() = default;

  // No copy
  Adapter(const Adapter&) = delete;
  Adapter& operator=(const Adapter&) = delete;

  virtual BackendKind Kind() const = 0;

  // --- Open / Close ---

  /// Open the native session. For the embedded-file backend `host` is the
  /// file path and the other fields are ignored.
  virtual Error Connect(const ConnectParams& params) = 0;

  /// Release the native session. Safe to call repeatedly.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // --- Catalog ---

  virtual std::vector<std::string> ListDatabases(Error* out_error) = 0;

  /// False when the session is bound to one database for its lifetime.
  /// The registry then switches databases by replacing the adapter and
  /// never calls UseDatabase().
  virtual bool RebindsInPlace() const { return true; }

  virtual Error UseDatabase(const std::string& name) = 0;

  virtual std::string CurrentDatabase(Error* out_error) = 0;

  /// Base tables of the current database, in catalog order, without
  /// backend-internal tables.
  virtual std::vector<std::string> ListTables(Error* out_error) = 0;

  /// Columns of `table` in declaration order.
  virtual std::vector<ColumnDescriptor> DescribeTable(
      const std::string& table, Error* out_error) = 0;

  // --- Query ---

  /// Execute `sql` verbatim.
  virtual QueryResult ExecuteQuery(const std::string& sql,
                                   Error* out_error) = 0;
};

/// Creates an unconnected adapter for `kind`, or nullptr when the backend
/// is not available in this build.
using AdapterFactory = std::function<std::unique_ptr<Adapter>(BackendKind)>;

// ---------------------------------------------------------------------------
// Helpers shared by the adapters
// ---------------------------------------------------------------------------

/// Quote an identifier with `quote`, doubling embedded quote characters.
inline std::string QuoteIdentifier(const std::string& name, char quote) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back(quote);
  for (char ch : name) {
    out.push_back(ch);
    if (ch == quote) { out.push_back(quote); }
  }
  out.push_back(quote);
  return out;
}

/// Build a Row from the cursor's current position.
template <typename Query>
Row RowFromCursor(const Query& q) {
  Row row;
  for (int32_t i = 0; i < q.NumFields(); ++i) {
    const char* name = q.FieldName(i);
    row.Set(name != nullptr ? name : "", q.GetValue(i));
  }
  return row;
}

/// First column of every row, as text. Used for name listings.
template <typename Query>
std::vector<std::string> FirstColumn(Query& q) {
  std::vector<std::string> out;
  while (!q.Eof()) {
    out.emplace_back(q.GetString(0));
    q.NextRow();
  }
  return out;
}

}  // namespace qbridge
