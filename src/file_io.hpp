#pragma once
/*
 * FileIo
 *
 * Purpose: small POSIX file helpers: whole-file/line reads via mmap and
 * safe writes (write .tmp → fdatasync → atomic rename).
 * Usage: every call returns false with msg on failure; nothing throws.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { if (fd_ >= 0) ::close(fd_); fd_ = fd; }
private:
  int fd_;
};

bool read_file(const std::filesystem::path& path, std::string& out, std::string& msg);
// Splits on '\n' and drops a trailing '\r' from each line.
bool read_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, std::string_view content, std::string& msg);
