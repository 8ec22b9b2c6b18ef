#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning POSIX file descriptor; closes on destruction.
 * Usage: UniqueFd::open(path, flags[, mode]); check valid() before use.
 */
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <sys/types.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }

  // retries open() interrupted by a signal
  static UniqueFd open(const std::filesystem::path& path, int flags, mode_t mode = 0) {
    int fd;
    do { fd = ::open(path.c_str(), flags, mode); } while (fd < 0 && errno == EINTR);
    return UniqueFd(fd);
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_;
};
