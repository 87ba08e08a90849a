#pragma once
/*
 * AnsiTerminal
 *
 * Purpose: ITerminal implementation that buffers control sequences for a file descriptor.
 * Sequences: taken from terminfo (via ncurses) when the entry has them, plain ANSI otherwise.
 * Note: nothing reaches the fd until flush(); the session flushes once per input event.
 */
#include "iterminal.hpp"
#include "terminfo.hpp"
#include <unistd.h>

class AnsiTerminal : public ITerminal {
public:
  explicit AnsiTerminal(int fd = STDOUT_FILENO);
  void move_to_column(int col) override;
  void move_up(int n) override;
  void move_down(int n) override;
  void move_left(int n) override;
  void move_right(int n) override;
  void save_position() override;
  void restore_position() override;
  void clear_to_end_of_screen() override;
  void clear_to_end_of_line() override;
  void set_color(const std::string& code) override;
  void reset_color() override;
  void put_char(char32_t ch) override;
  void put_text(std::string_view utf8) override;
  bool flush(std::error_code& ec) override;
  const std::string& pending() const { return out_; }
private:
  void move(const char* cap, char ansi_final, int n);
  int fd_;
  Terminfo ti_;
  std::string out_;
  std::string save_;
  std::string restore_;
  std::string clear_eos_;
  std::string clear_eol_;
  std::string sgr0_;
};
