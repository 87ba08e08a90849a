#pragma once
/*
 * Terminal
 *
 * Purpose: RAII guard that puts a TTY into raw input mode for one read session.
 * Usage: construct at the top of Session::read(); destructor restores the saved termios.
 * Note: a descriptor that is not a TTY (file, pipe, -1) is left untouched and ok() stays true.
 */
#include <system_error>
#include <termios.h>

class Terminal {
public:
  explicit Terminal(int fd);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  bool ok() const { return !error_; }
  bool active() const { return active_; }
  const std::error_code& error() const { return error_; }
  // restore early; the destructor then does nothing
  void release();

private:
  int fd_;
  struct termios saved_{};
  bool active_ = false;
  std::error_code error_;
};
