#pragma once
#include <unistd.h>
#include <cerrno>
#include <cstddef>

// Owns a POSIX file descriptor; closes it on destruction.
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

  // Loops over short writes and EINTR.
  bool write_all(const void* data, std::size_t len) const {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
      ssize_t w = ::write(fd_, p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      len -= static_cast<std::size_t>(w);
    }
    return true;
  }

  bool sync() const {
#if defined(__APPLE__)
    return ::fsync(fd_) == 0;
#else
    return ::fdatasync(fd_) == 0;
#endif
  }

private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};
