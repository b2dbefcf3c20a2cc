#include "error.hpp"
#include <cerrno>
#include <cstring>

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "ok";
    case ErrorKind::Io: return "io error";
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::InvalidData: return "invalid data";
    case ErrorKind::Range: return "range error";
    case ErrorKind::ChecksumMismatch: return "checksum mismatch";
    case ErrorKind::SizeMismatch: return "size mismatch";
    case ErrorKind::ChannelClosed: return "channel closed";
    case ErrorKind::Timeout: return "timed out";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Remote: return "remote error";
    case ErrorKind::WouldDeadlock: return "would deadlock";
    case ErrorKind::Busy: return "busy";
  }
  return "unknown";
}

std::string Error::to_string() const {
  std::string s(error_kind_name(kind));
  if (!message.empty()) { s += ": "; s += message; }
  return s;
}

bool fail_errno(Error& err, const std::string& what, int errnum) {
  ErrorKind kind = (errnum == ENOENT) ? ErrorKind::NotFound : ErrorKind::Io;
  return fail(err, kind, what + ": " + std::strerror(errnum));
}
