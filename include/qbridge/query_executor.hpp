// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::QueryExecutor -- run caller SQL on an open connection.
//
// SQL is passed to the backend verbatim; no rewriting, no parameter
// binding. Rows come back in backend order, field names in column order.

#pragma once

#include <string>

#include "qbridge/adapter.hpp"
#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/registry.hpp"
#include "qbridge/value.hpp"

namespace qbridge {

class QueryExecutor {
 public:
  explicit QueryExecutor(ConnectionRegistry& registry)
      : registry_(registry) {}

  /// Failures are kConnectionNotFound or kQueryFailed with the backend's
  /// message.
  QueryResult Execute(const std::string& id, const std::string& sql,
                      Error* out_error = nullptr) {
    QueryResult result;
    Error err = registry_.WithAdapter(id, [&](Adapter& adapter) {
      Log().debug("{}: {}", id, sql);
      Error query_err;
      result = adapter.ExecuteQuery(sql, &query_err);
      return query_err;
    });
    if (!err.ok()) {
      Log().warn("{}: query failed: {}", id, err.message);
      Report(out_error, err);
      return QueryResult{};
    }
    Log().debug("{}: {} row(s)", id, result.size());
    return result;
  }

 private:
  ConnectionRegistry& registry_;
};

}  // namespace qbridge
