// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge::Error -- error reporting without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + message, returned or written to Error*
//   - Backend messages are stored in full, never truncated
//   - Taxonomy codes for the registry boundary, low-level codes for the
//     native wrappers

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>

namespace qbridge {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kNullParam = -3,
  kMisuse = -4,

  kUnsupportedBackend = -10,
  kConnectFailed = -11,
  kConnectionNotFound = -12,
  kBackendError = -13,
  kQueryFailed = -14,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:                 return "Ok";
    case ErrorCode::kError:              return "Error";
    case ErrorCode::kNotOpen:            return "NotOpen";
    case ErrorCode::kNullParam:          return "NullParam";
    case ErrorCode::kMisuse:             return "Misuse";
    case ErrorCode::kUnsupportedBackend: return "UnsupportedBackend";
    case ErrorCode::kConnectFailed:      return "ConnectFailed";
    case ErrorCode::kConnectionNotFound: return "ConnectionNotFound";
    case ErrorCode::kBackendError:       return "BackendError";
    case ErrorCode::kQueryFailed:        return "QueryFailed";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      message = msg;
    } else {
      message.clear();
    }
  }

  void Set(ErrorCode c, const std::string& msg) {
    code = c;
    message = msg;
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    message.clear();
    if (fmt == nullptr) { return; }

    va_list ap;
    va_start(ap, fmt);
    va_list ap_copy;
    va_copy(ap_copy, ap);
    int32_t len = std::vsnprintf(nullptr, 0, fmt, ap_copy);
    va_end(ap_copy);
    if (len > 0) {
      message.resize(static_cast<size_t>(len) + 1);
      std::vsnprintf(&message[0], message.size(), fmt, ap);
      message.resize(static_cast<size_t>(len));
    }
    va_end(ap);
  }

  void Clear() {
    code = ErrorCode::kOk;
    message.clear();
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error Make(ErrorCode c, const std::string& msg) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

/// Copy `err` into `out_error` when the caller asked for it.
inline void Report(Error* out_error, const Error& err) {
  if (out_error != nullptr) { *out_error = err; }
}

/// Same as Report() but re-tags the code, keeping the message verbatim.
inline void Report(Error* out_error, ErrorCode code, const Error& err) {
  if (out_error != nullptr) { out_error->Set(code, err.message); }
}

}  // namespace qbridge
