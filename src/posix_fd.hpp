#pragma once
/*
 * UniqueFd
 *
 * Purpose: RAII owner of a POSIX file descriptor, plus the short-write
 *          and data-sync loops every writer in the project needs.
 */
#include <unistd.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstddef>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

/* returns 0 or the errno of the failing write */
inline int write_fully(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      return errno;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return 0;
}

/* returns 0 or errno */
inline int sync_data(int fd) {
#if defined(__APPLE__)
  return ::fsync(fd) == 0 ? 0 : errno;
#else
  return ::fdatasync(fd) == 0 ? 0 : errno;
#endif
}

/* like write_fully, but never raises SIGPIPE when fd is a socket */
inline int send_fully(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::send(fd, p, len, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) continue;
      if (errno == ENOTSOCK) return write_fully(fd, p, len);
      return errno;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return 0;
}
