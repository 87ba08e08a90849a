#include "terminal.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

Terminal::Terminal(int fd) : fd_(fd) {
  if (fd_ < 0 || !::isatty(fd_)) return;
  if (::tcgetattr(fd_, &saved_) != 0) {
    error_ = std::error_code(errno, std::system_category());
    ML_LOG("tcgetattr on fd %d failed: %s", fd_, error_.message().c_str());
    return;
  }
  struct termios raw = saved_;
  raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
  raw.c_oflag &= ~(OPOST);
  raw.c_cflag |= (CS8);
  raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
    error_ = std::error_code(errno, std::system_category());
    ML_LOG("tcsetattr on fd %d failed: %s", fd_, error_.message().c_str());
    return;
  }
  active_ = true;
  ML_LOG("raw mode on fd %d", fd_);
}

Terminal::~Terminal() {
  release();
}

void Terminal::release() {
  if (!active_) return;
  active_ = false;
  if (::tcsetattr(fd_, TCSAFLUSH, &saved_) != 0) {
    ML_LOG("restoring termios on fd %d failed: %s", fd_, std::strerror(errno));
    return;
  }
  ML_LOG("raw mode off fd %d", fd_);
}
