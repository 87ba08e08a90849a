#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract output sink for line rendering (cursor motion, clears, color, text).
 * Goal: decouple Editor from concrete backends (ANSI fd / headless), enable testing.
 * Note: every call only appends to a buffer; flush() is the one place a write can fail.
 */
#include <string>
#include <string_view>
#include <system_error>

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual void move_to_column(int col) = 0;
  virtual void move_up(int n) = 0;
  virtual void move_down(int n) = 0;
  virtual void move_left(int n) = 0;
  virtual void move_right(int n) = 0;
  virtual void save_position() = 0;
  virtual void restore_position() = 0;
  virtual void clear_to_end_of_screen() = 0;
  virtual void clear_to_end_of_line() = 0;
  virtual void set_color(const std::string& code) = 0;
  virtual void reset_color() = 0;
  virtual void put_char(char32_t ch) = 0;
  virtual void put_text(std::string_view utf8) = 0;
  virtual bool flush(std::error_code& ec) = 0;
};
