#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <span>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace io {

class file_descriptor {
  static constexpr int invalid = -1;

public:
  using native_handle_t = int;

  constexpr file_descriptor() noexcept = default;
  constexpr explicit file_descriptor(native_handle_t fd) noexcept : fd_(fd) {}

  file_descriptor(const file_descriptor&) = delete;
  file_descriptor& operator=(const file_descriptor&) = delete;

  constexpr file_descriptor(file_descriptor&& rhs) noexcept : fd_(rhs.fd_) { rhs.fd_ = invalid; }
  constexpr file_descriptor& operator=(file_descriptor&& rhs) noexcept {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = std::exchange(rhs.fd_, invalid);
    return *this;
  }

  ~file_descriptor() noexcept {
    if (fd_ >= 0)
      ::close(fd_);
  }

  constexpr explicit operator bool() const noexcept { return fd_ != invalid; }
  constexpr native_handle_t native_handle() const noexcept { return fd_; }

private:
  native_handle_t fd_ = invalid;
};

enum class mode : int {
  write_only = O_WRONLY,
  read_only = O_RDONLY,
  tmpfile = O_TMPFILE,
  cloexec = O_CLOEXEC,
};
constexpr mode operator|(mode lhs, mode rhs) noexcept {
  return static_cast<mode>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

constexpr fs::perms default_perms =
    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;

inline file_descriptor open(const fs::path& path, mode flags, fs::perms perms = default_perms) {
  int fd = -1;
  do
    fd = ::open(path.c_str(), static_cast<int>(flags | mode::cloexec), static_cast<mode_t>(perms));
  while (fd < 0 && errno == EINTR);
  if (fd < 0)
    throw std::system_error{errno, std::system_category(), "open " + path.string()};
  return file_descriptor{fd};
}
inline file_descriptor open_anonymous(const fs::path& dir, mode flags, fs::perms perms = default_perms) {
  return open(dir, flags | mode::tmpfile, perms);
}

inline file_descriptor duplicate(int fd) {
  const int res = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (res < 0)
    throw std::system_error{errno, std::system_category(), "dup"};
  return file_descriptor{res};
}

// Single read(2) call, zero is returned only at the end of file
inline size_t read(const file_descriptor& fd, std::span<std::byte> buf, std::error_code& ec) noexcept {
  ssize_t res;
  do
    res = ::read(fd.native_handle(), buf.data(), buf.size());
  while (res < 0 && errno == EINTR);
  if (res < 0) {
    ec = {errno, std::system_category()};
    return 0;
  }
  return static_cast<size_t>(res);
}

inline size_t read(const file_descriptor& fd, std::span<std::byte> buf) {
  std::error_code ec;
  size_t res = read(fd, buf, ec);
  if (ec)
    throw std::system_error(ec, "read");
  return res;
}

// Repeats write(2) until all the data is written
inline void write(const file_descriptor& fd, std::span<const std::byte> data, std::error_code& ec) noexcept {
  while (!data.empty()) {
    ssize_t res;
    do
      res = ::write(fd.native_handle(), data.data(), data.size());
    while (res < 0 && errno == EINTR);
    if (res < 0) {
      ec = {errno, std::system_category()};
      return;
    }
    data = data.subspan(static_cast<size_t>(res));
  }
}
inline void write(const file_descriptor& fd, std::span<const std::byte> data) {
  std::error_code ec;
  write(fd, data, ec);
  if (ec)
    throw std::system_error(ec, "write");
}

inline void sync(const file_descriptor& fd, std::error_code& ec) noexcept {
  int res;
  do
    res = ::fsync(fd.native_handle());
  while (res < 0 && errno == EINTR);
  if (res < 0)
    ec = {errno, std::system_category()};
}
inline void sync(const file_descriptor& fd) {
  std::error_code ec;
  sync(fd, ec);
  if (ec)
    throw std::system_error{ec, "fsync"};
}

inline std::chrono::system_clock::time_point modification_time(const file_descriptor& fd) {
  struct ::stat st;
  if (::fstat(fd.native_handle(), &st) < 0)
    throw std::system_error{errno, std::system_category(), "fstat"};
  const auto since_epoch = std::chrono::seconds{st.st_mtim.tv_sec} + std::chrono::nanoseconds{st.st_mtim.tv_nsec};
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch)};
}

/// File which appears at its destination path only after successful commit.
/// Nothing is left on disk if it is destroyed without commit.
class transactional_file {
public:
  transactional_file() noexcept = default;
  transactional_file(const fs::path& path, mode flags, fs::perms perms = io::default_perms)
      : fd_{io::open_anonymous(path.parent_path().empty() ? fs::path{"."} : path.parent_path(), flags, perms)},
        dest_path_{path} {}

  operator const file_descriptor&() const noexcept { return fd_; }

  // Linked under a sibling name first and renamed over the destination so an
  // existing file is replaced atomically.
  void commit() {
    sync(fd_);
    std::array<char, 64> buf;
    ::snprintf(buf.data(), buf.size(), "/proc/self/fd/%d", static_cast<int>(fd_.native_handle()));
    const fs::path part_path = dest_path_.string() + ".part";
    if (::linkat(AT_FDCWD, buf.data(), AT_FDCWD, part_path.c_str(), AT_SYMLINK_FOLLOW) < 0)
      throw std::system_error{errno, std::system_category(), "linkat " + part_path.string()};
    if (::rename(part_path.c_str(), dest_path_.c_str()) < 0) {
      const int err = errno;
      ::unlink(part_path.c_str());
      throw std::system_error{err, std::system_category(), "rename " + dest_path_.string()};
    }
  }

private:
  file_descriptor fd_;
  fs::path dest_path_;
};

} // namespace io
