#include "byte_source.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

std::optional<unsigned char> StringByteSource::next(std::error_code& ec) {
  ec.clear();
  if (pos_ >= bytes_.size()) return std::nullopt;
  return static_cast<unsigned char>(bytes_[pos_++]);
}

std::optional<FdByteSource> FdByteSource::open(const std::filesystem::path& path, std::string& msg) {
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return std::nullopt; }
  return FdByteSource(std::move(fd));
}

std::optional<unsigned char> FdByteSource::next(std::error_code& ec) {
  ec.clear();
  unsigned char c = 0;
  for (;;) {
    ssize_t n = ::read(fd_, &c, 1);
    if (n == 1) return c;
    if (n == 0) return std::nullopt;
    if (errno == EINTR) continue;
    ec = std::error_code(errno, std::system_category());
    return std::nullopt;
  }
}
