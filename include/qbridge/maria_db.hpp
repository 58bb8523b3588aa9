// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::MariaDb -- MariaDB/MySQL session with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - SelectDb() rebinds the live session to another schema
//   - Connection parameters come from ConnectParams (see config.hpp for
//     the "host:port:user:password:database" DSN form)

#pragma once

#include <cstdint>
#include <cstring>

#include <mysql.h>

#include "qbridge/error.hpp"
#include "qbridge/log.hpp"
#include "qbridge/maria_query.hpp"
#include "qbridge/types.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// MariaDb
// ---------------------------------------------------------------------------

class MariaDb {
 public:
  static constexpr uint16_t kDefaultPort = 3306;

  MariaDb() = default;

  ~MariaDb() { Close(); }

  // Move
  MariaDb(MariaDb&& other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  MariaDb& operator=(MariaDb&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaDb(const MariaDb&) = delete;
  MariaDb& operator=(const MariaDb&) = delete;

  // --- Open / Close ---

  Error Open(const ConnectParams& params) {
    Close();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    if (params.connect_timeout_s > 0) {
      unsigned int timeout = static_cast<unsigned int>(params.connect_timeout_s);
      if (mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout) != 0) {
        Log().warn("mysql: connect timeout not applied");
      }
    }

    const char* host = params.host.empty() ? "localhost" : params.host.c_str();
    const char* user = params.user.empty() ? nullptr : params.user.c_str();
    const char* password =
        params.password.empty() ? nullptr : params.password.c_str();
    const char* database =
        params.database.empty() ? nullptr : params.database.c_str();
    unsigned int port = (params.port != 0) ? params.port : kDefaultPort;

    if (mysql_real_connect(conn_, host, user, password, database,
                           port, nullptr, 0) == nullptr) {
      Error err = Error::Make(ErrorCode::kError, mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    if (mysql_set_character_set(conn_, "utf8mb4") != 0) {
      Log().warn("mysql: utf8mb4 unavailable: {}", mysql_error(conn_));
    }

    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- Query ---

  /// Run `sql` and buffer its first result. Statements without a result
  /// set yield an empty query and no error. Any further results (CALL
  /// returns at least two) are read and dropped so the session stays in
  /// sync for the next statement.
  MariaQuery ExecQuery(const char* sql, Error* out_error = nullptr) {
    if (!CheckReady(sql, out_error)) { return MariaQuery{}; }

    if (mysql_query(conn_, sql) != 0) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kError, mysql_error(conn_));
      }
      return MariaQuery{};
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res == nullptr && mysql_field_count(conn_) > 0) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kError, mysql_error(conn_));
      }
      return MariaQuery{};
    }

    Error drain_err = DrainResults();
    if (!drain_err.ok()) {
      if (res != nullptr) { mysql_free_result(res); }
      if (out_error != nullptr) { *out_error = drain_err; }
      return MariaQuery{};
    }

    // Non-SELECT statement
    if (res == nullptr) { return MariaQuery{}; }

    bool eof = (mysql_num_rows(res) == 0);
    return MariaQuery(res, eof);
  }

  // --- Schema ---

  Error SelectDb(const char* name) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (name == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "database name is null");
    }
    if (mysql_select_db(conn_, name) != 0) {
      return Error::Make(ErrorCode::kError, mysql_error(conn_));
    }
    return Error::Ok();
  }

 private:
  Error DrainResults() {
    while (mysql_more_results(conn_)) {
      int status = mysql_next_result(conn_);
      if (status > 0) {
        return Error::Make(ErrorCode::kError, mysql_error(conn_));
      }
      if (status < 0) { break; }
      MYSQL_RES* extra = mysql_store_result(conn_);
      if (extra != nullptr) {
        mysql_free_result(extra);
      } else if (mysql_field_count(conn_) > 0) {
        return Error::Make(ErrorCode::kError, mysql_error(conn_));
      }
    }
    return Error::Ok();
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

  MYSQL* conn_ = nullptr;
};

}  // namespace qbridge
