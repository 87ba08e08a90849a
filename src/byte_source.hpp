#pragma once
/*
 * ByteSource
 *
 * Purpose: blocking byte input for the decoder (terminal fd, file, or memory).
 * Contract: nullopt with ec clear is end of stream; nullopt with ec set is an I/O failure.
 */
#include <optional>
#include <string>
#include <system_error>
#include <filesystem>
#include "posix_fd.hpp"

class IByteSource {
public:
  virtual ~IByteSource() = default;
  virtual std::optional<unsigned char> next(std::error_code& ec) = 0;
  // descriptor raw mode applies to; -1 when the source is not a terminal
  virtual int fd() const { return -1; }
};

class StringByteSource : public IByteSource {
public:
  explicit StringByteSource(std::string bytes) : bytes_(std::move(bytes)) {}
  std::optional<unsigned char> next(std::error_code& ec) override;
  size_t remaining() const { return bytes_.size() - pos_; }
private:
  std::string bytes_;
  size_t pos_ = 0;
};

class FdByteSource : public IByteSource {
public:
  explicit FdByteSource(int fd) : fd_(fd) {}
  static std::optional<FdByteSource> open(const std::filesystem::path& path, std::string& msg);
  std::optional<unsigned char> next(std::error_code& ec) override;
  int fd() const override { return fd_; }
private:
  explicit FdByteSource(UniqueFd owned) : fd_(owned.get()), owned_(std::move(owned)) {}
  int fd_;
  UniqueFd owned_;
};
