#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal that models the visible screen, for tests and render checks.
 * Model: unbounded rows and columns, no wrapping or scrolling; colors are counted, not drawn.
 *        Wide characters fill two cells, as char_width() reports them.
 * Assert: screen() returns rows with trailing blanks trimmed, trailing empty rows dropped.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
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

  std::vector<std::string> screen() const;
  std::string row_text(int row) const;
  int cursor_row() const { return row_; }
  int cursor_col() const { return col_; }
  int flush_count() const { return flushes_; }
  int color_changes() const { return color_changes_; }
  // the next flush() reports ec instead of succeeding
  void fail_next_flush(std::error_code ec) { pending_failure_ = ec; }

private:
  void ensure_row(int row);
  std::vector<std::u32string> rows_{std::u32string()};
  int row_ = 0;
  int col_ = 0;
  int saved_row_ = 0;
  int saved_col_ = 0;
  int flushes_ = 0;
  int color_changes_ = 0;
  std::error_code pending_failure_;
};
