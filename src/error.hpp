#pragma once
/*
 * Error
 *
 * Purpose: distinguishable failure values for fallible operations.
 * Usage: bool fn(..., Error& err); on false, err.kind says what went wrong.
 */
#include <string>
#include <string_view>

enum class ErrorKind {
  None,
  Io,
  NotFound,
  InvalidData,
  Range,
  ChecksumMismatch,
  SizeMismatch,
  ChannelClosed,
  Timeout,
  Cancelled,
  Remote,
  WouldDeadlock,
  Busy,
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }
  void clear() { kind = ErrorKind::None; message.clear(); }
  std::string to_string() const;
};

std::string_view error_kind_name(ErrorKind kind);

inline bool fail(Error& err, ErrorKind kind, std::string msg) {
  err.kind = kind;
  err.message = std::move(msg);
  return false;
}

/* errno-based failure: "<what>: <strerror>", NotFound for ENOENT */
bool fail_errno(Error& err, const std::string& what, int errnum);
