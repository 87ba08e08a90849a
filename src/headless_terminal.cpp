#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <algorithm>

void HeadlessTerminal::ensure_row(int row) {
  if (row >= static_cast<int>(rows_.size())) rows_.resize(static_cast<size_t>(row) + 1);
}

void HeadlessTerminal::move_to_column(int col) { col_ = std::max(0, col); }
void HeadlessTerminal::move_up(int n) { row_ = std::max(0, row_ - n); }
void HeadlessTerminal::move_down(int n) { row_ += n; ensure_row(row_); }
void HeadlessTerminal::move_left(int n) { col_ = std::max(0, col_ - n); }
void HeadlessTerminal::move_right(int n) { col_ += n; }
void HeadlessTerminal::save_position() { saved_row_ = row_; saved_col_ = col_; }
void HeadlessTerminal::restore_position() { row_ = saved_row_; col_ = saved_col_; ensure_row(row_); }

void HeadlessTerminal::clear_to_end_of_line() {
  ensure_row(row_);
  auto& r = rows_[row_];
  if (col_ < static_cast<int>(r.size())) r.resize(static_cast<size_t>(col_));
}

void HeadlessTerminal::clear_to_end_of_screen() {
  clear_to_end_of_line();
  rows_.resize(static_cast<size_t>(row_) + 1);
}

void HeadlessTerminal::set_color(const std::string&) { color_changes_++; }
void HeadlessTerminal::reset_color() { color_changes_++; }

void HeadlessTerminal::put_char(char32_t ch) {
  if (ch == U'\r') { col_ = 0; return; }
  if (ch == U'\n') { row_++; ensure_row(row_); return; }
  ensure_row(row_);
  auto& r = rows_[row_];
  int w = char_width(ch);
  // a wide character owns the next cell too, held by a NUL filler
  for (int i = 0; i < w; ++i) {
    char32_t cell = (i == 0) ? ch : U'\0';
    if (col_ > static_cast<int>(r.size())) r.resize(static_cast<size_t>(col_), U' ');
    if (col_ < static_cast<int>(r.size())) r[col_] = cell;
    else r.push_back(cell);
    col_++;
  }
}

void HeadlessTerminal::put_text(std::string_view utf8) {
  for (char32_t c : utf8_to_u32(utf8)) put_char(c);
}

bool HeadlessTerminal::flush(std::error_code& ec) {
  flushes_++;
  if (pending_failure_) {
    ec = pending_failure_;
    pending_failure_.clear();
    return false;
  }
  ec.clear();
  return true;
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= static_cast<int>(rows_.size())) return std::string();
  std::u32string r = rows_[row];
  while (!r.empty() && r.back() == U' ') r.pop_back();
  std::string out;
  for (char32_t c : r) {
    if (c != U'\0') utf8_append(out, c);
  }
  return out;
}

std::vector<std::string> HeadlessTerminal::screen() const {
  std::vector<std::string> out;
  for (int i = 0; i < static_cast<int>(rows_.size()); ++i) out.push_back(row_text(i));
  while (!out.empty() && out.back().empty()) out.pop_back();
  return out;
}
