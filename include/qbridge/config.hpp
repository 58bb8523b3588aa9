// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge configuration helpers.
//
// Design:
//   - DSN format: "host:port:user:password:database", every field optional
//       e.g. "localhost:3306:root:pass:testdb"
//       or   "127.0.0.1:5432:postgres::" (empty password, default db)
//       or   "./fixture.db" (embedded-file backend, path only; use
//            ParamsForBackend() for paths containing ':')
//   - Backend names are case-insensitive with common aliases
//   - Environment lookups fall back to caller-provided defaults

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include <spdlog/spdlog.h>

#include "qbridge/error.hpp"
#include "qbridge/types.hpp"

namespace qbridge {

// ---------------------------------------------------------------------------
// Backend names
// ---------------------------------------------------------------------------

/// Returns false for unknown or null names; `out` is left untouched.
inline bool ParseBackendKind(const char* name, BackendKind* out) {
  if (name == nullptr || out == nullptr) { return false; }
  std::string lower(name);
  for (auto& ch : lower) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }

  if (lower == "mysql" || lower == "mariadb") {
    *out = BackendKind::kMariaDb;
  } else if (lower == "postgresql" || lower == "postgres" || lower == "pg") {
    *out = BackendKind::kPostgres;
  } else if (lower == "sqlite" || lower == "sqlite3") {
    *out = BackendKind::kSqlite3;
  } else {
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// DSN
// ---------------------------------------------------------------------------

/// Parse "host:port:user:password:database". Missing trailing fields keep
/// their defaults; a password may not contain ':'. A port that is not a
/// number in 1..65535 is kMisuse and leaves the default port.
inline ConnectParams ParseDsn(const char* dsn, Error* out_error = nullptr) {
  ConnectParams params;
  if (dsn == nullptr) { return params; }

  std::string parts[5];
  int32_t count = 1;
  for (const char* p = dsn; *p != '\0'; ++p) {
    if (*p == ':' && count < 5) {
      ++count;
      continue;
    }
    parts[count - 1].push_back(*p);
  }

  params.host = parts[0];
  if (count >= 2 && !parts[1].empty()) {
    char* end = nullptr;
    unsigned long port = std::strtoul(parts[1].c_str(), &end, 10);
    bool digits = std::isdigit(static_cast<unsigned char>(parts[1][0])) != 0;
    if (!digits || *end != '\0' || port == 0 || port > 65535) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "invalid port: " + parts[1]);
      }
    } else {
      params.port = static_cast<uint16_t>(port);
    }
  }
  if (count >= 3) { params.user = parts[2]; }
  if (count >= 4) { params.password = parts[3]; }
  if (count >= 5) { params.database = parts[4]; }
  return params;
}

/// Connection parameters for `backend_name`. The embedded-file backend
/// takes the whole DSN as its path (":memory:" included); every other
/// name goes through ParseDsn().
inline ConnectParams ParamsForBackend(const char* backend_name,
                                      const char* dsn,
                                      Error* out_error = nullptr) {
  BackendKind kind;
  if (ParseBackendKind(backend_name, &kind) &&
      kind == BackendKind::kSqlite3) {
    ConnectParams params;
    if (dsn != nullptr) { params.host = dsn; }
    return params;
  }
  return ParseDsn(dsn, out_error);
}

/// DSN from environment variable `var`, or `fallback` when unset.
inline ConnectParams ParamsFromEnv(const char* var, const char* fallback,
                                   Error* out_error = nullptr) {
  const char* dsn = (var != nullptr) ? std::getenv(var) : nullptr;
  return ParseDsn(dsn != nullptr ? dsn : fallback, out_error);
}

// ---------------------------------------------------------------------------
// Log level
// ---------------------------------------------------------------------------

inline spdlog::level::level_enum ParseLogLevel(
    const char* name, spdlog::level::level_enum fallback) {
  if (name == nullptr) { return fallback; }
  if (std::strcmp(name, "trace") == 0) { return spdlog::level::trace; }
  if (std::strcmp(name, "debug") == 0) { return spdlog::level::debug; }
  if (std::strcmp(name, "info") == 0) { return spdlog::level::info; }
  if (std::strcmp(name, "warn") == 0) { return spdlog::level::warn; }
  if (std::strcmp(name, "error") == 0) { return spdlog::level::err; }
  if (std::strcmp(name, "critical") == 0) { return spdlog::level::critical; }
  if (std::strcmp(name, "off") == 0) { return spdlog::level::off; }
  return fallback;
}

/// QBRIDGE_LOG_LEVEL, defaulting to `fallback`.
inline spdlog::level::level_enum LogLevelFromEnv(
    spdlog::level::level_enum fallback = spdlog::level::warn) {
  return ParseLogLevel(std::getenv("QBRIDGE_LOG_LEVEL"), fallback);
}

}  // namespace qbridge
