// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::PgDb -- PostgreSQL session with RAII.
//
// Design:
//   - Wraps PGconn* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - A PostgreSQL session is bound to one database for its lifetime;
//     switching databases means opening a new PgDb
//   - ExecParams() passes catalog lookups as text parameters ($1, $2...)
//   - Server notices go to the qbridge logger at debug level

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <libpq-fe.h>

#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/pg_query.hpp"
#include "qbridge/types.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// PgDb
// ---------------------------------------------------------------------------

class PgDb {
 public:
  static constexpr uint16_t kDefaultPort = 5432;

  PgDb() = default;

  ~PgDb() { Close(); }

  // Move
  PgDb(PgDb&& other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  PgDb& operator=(PgDb&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  // No copy
  PgDb(const PgDb&) = delete;
  PgDb& operator=(const PgDb&) = delete;

  // --- Open / Close ---

  Error Open(const ConnectParams& params) {
    Close();

    std::string port = std::to_string(
        params.port != 0 ? params.port : kDefaultPort);
    std::string timeout = std::to_string(params.connect_timeout_s);
    const std::string encoding = "UTF8";

    std::vector<const char*> keys;
    std::vector<const char*> values;
    auto add = [&keys, &values](const char* key, const std::string& value) {
      if (value.empty()) { return; }
      keys.push_back(key);
      values.push_back(value.c_str());
    };
    add("host", params.host);
    add("port", port);
    add("user", params.user);
    add("password", params.password);
    add("dbname", params.database);
    if (params.connect_timeout_s > 0) { add("connect_timeout", timeout); }
    add("client_encoding", encoding);
    keys.push_back(nullptr);
    values.push_back(nullptr);

    conn_ = PQconnectdbParams(keys.data(), values.data(), 0);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "PQconnectdbParams failed");
    }
    if (PQstatus(conn_) != CONNECTION_OK) {
      Error err = Error::Make(ErrorCode::kError,
                              TrimMessage(PQerrorMessage(conn_)));
      Close();
      return err;
    }

    PQsetNoticeProcessor(conn_, &PgDb::OnNotice, nullptr);
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      PQfinish(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- Query ---

  /// Run `sql` as a simple query. Commands without rows yield an empty
  /// cursor and no error, blank SQL is kMisuse; with several statements
  /// the last result wins.
  PgQuery ExecQuery(const char* sql, Error* out_error = nullptr) {
    if (!CheckReady(sql, out_error)) { return PgQuery{}; }
    return TakeResult(PQexec(conn_, sql), out_error);
  }

  /// Run a single statement with text parameters bound to $1..$n.
  PgQuery ExecParams(const char* sql, const std::vector<std::string>& params,
                     Error* out_error = nullptr) {
    if (!CheckReady(sql, out_error)) { return PgQuery{}; }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) { values.push_back(p.c_str()); }

    PGresult* res = PQexecParams(conn_, sql, static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    return TakeResult(res, out_error);
  }

  /// Name of the database this session is bound to.
  std::string DatabaseName() const {
    if (conn_ == nullptr) { return std::string(); }
    const char* name = PQdb(conn_);
    return (name != nullptr) ? name : std::string();
  }

 private:
  static void OnNotice(void* /*arg*/, const char* message) {
    if (message != nullptr) {
      Log().debug("postgres notice: {}", TrimMessage(message));
    }
  }

  /// libpq messages end with a newline.
  static std::string TrimMessage(const char* message) {
    std::string out = (message != nullptr) ? message : "";
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
      out.pop_back();
    }
    return out;
  }

  bool CheckReady(const char* sql, Error* out_error) const {
    if (conn_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return false;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return false;
    }
    return true;
  }

  PgQuery TakeResult(PGresult* res, Error* out_error) {
    if (res == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kError, TrimMessage(PQerrorMessage(conn_)));
      }
      return PgQuery{};
    }

    switch (PQresultStatus(res)) {
      case PGRES_TUPLES_OK:
        return PgQuery(res);
      case PGRES_COMMAND_OK:
        PQclear(res);
        return PgQuery{};
      case PGRES_EMPTY_QUERY:
        PQclear(res);
        if (out_error != nullptr) {
          out_error->Set(ErrorCode::kMisuse, "no statement to execute");
        }
        return PgQuery{};
      default:
        break;
    }

    // Primary message is what the server said, without severity prefix
    // or the LINE/caret context.
    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = (primary != nullptr)
                              ? std::string(primary)
                              : TrimMessage(PQresultErrorMessage(res));
    PQclear(res);
    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError, message);
    }
    return PgQuery{};
  }

  PGconn* conn_ = nullptr;
};

}  // namespace qbridge
