#include "editor.hpp"
#include "utf8.hpp"
#include "log.hpp"
#include <algorithm>
#include <cwctype>

static inline bool is_newline(char32_t c) { return c == U'\n'; }

static inline bool is_space(char32_t c) {
  if (c < 0x80) return c == U' ' || (c >= U'\t' && c <= U'\r');
  return std::iswspace(static_cast<wint_t>(c)) != 0;
}

// word motion treats letters, digits and line breaks as one class, everything else as the other
static inline bool is_word(char32_t c) {
  if (is_newline(c)) return true;
  if (c < 0x80) return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
  return std::iswalnum(static_cast<wint_t>(c)) != 0;
}

static int prompt_width(const std::string& s) { return display_width(utf8_to_u32(s)); }

Editor::Editor(std::string color, std::string begin, std::string again)
  : color_(std::move(color)), begin_(std::move(begin)), again_(std::move(again)) {}

std::string Editor::to_string() const {
  std::string out;
  for (char32_t c : head_) utf8_append(out, c);
  for (char32_t c : tail_) utf8_append(out, c);
  return out;
}

bool Editor::ends_with(std::u32string_view pattern) const {
  if (pattern.size() > head_.size()) return false;
  return std::equal(pattern.rbegin(), pattern.rend(), head_.rbegin());
}

size_t Editor::column() const {
  auto it = std::find(head_.rbegin(), head_.rend(), U'\n');
  return static_cast<size_t>(std::distance(head_.rbegin(), it));
}

bool Editor::head_has_newline() const {
  return std::find(head_.begin(), head_.end(), U'\n') != head_.end();
}

void Editor::write_prompt(ITerminal& term, const std::string& text) const {
  term.set_color(color_);
  term.put_text(text);
  term.reset_color();
  term.put_char(U' ');
}

void Editor::prompt(ITerminal& term) const {
  term.move_to_column(0);
  write_prompt(term, head_has_newline() ? again_ : begin_);
}

void Editor::print_head(ITerminal& term) const {
  prompt(term);
  size_t col = column();
  for (size_t i = head_.size() - col; i < head_.size(); ++i) term.put_char(head_[i]);
}

void Editor::print_tail(ITerminal& term) const {
  term.save_position();
  term.clear_to_end_of_line();
  for (char32_t c : tail_) {
    if (is_newline(c)) break;
    term.put_char(c);
  }
  term.restore_position();
}

void Editor::print_inline(ITerminal& term, const std::string& text, const std::string& color) const {
  auto rlast = std::find(head_.rbegin(), head_.rend(), U'\n');
  int width = 0;
  bool row_above = (rlast != head_.rend());
  if (row_above) {
    // the line that ends at the last break in head, one row above the cursor
    auto rprev = std::find(std::next(rlast), head_.rend(), U'\n');
    width = prompt_width(rprev == head_.rend() ? begin_ : again_) + 1;
    for (auto it = std::next(rlast); it != rprev; ++it) width += char_width(*it);
  } else {
    width = prompt_width(begin_) + 1;
    for (char32_t c : head_) width += char_width(c);
    for (char32_t c : tail_) {
      if (is_newline(c)) break;
      width += char_width(c);
    }
  }
  term.save_position();
  if (row_above) term.move_up(1);
  term.move_to_column(width + 1);
  term.clear_to_end_of_line();
  term.set_color(color);
  term.put_text(text);
  term.reset_color();
  term.restore_position();
}

void Editor::undraw(ITerminal& term) const {
  int lines = static_cast<int>(std::count(head_.begin(), head_.end(), U'\n'));
  if (lines > 0) term.move_up(lines);
  term.move_to_column(0);
  term.clear_to_end_of_screen();
}

void Editor::redraw(ITerminal& term) const {
  write_prompt(term, begin_);
  for (char32_t c : head_) {
    if (is_newline(c)) { term.put_text("\r\n"); write_prompt(term, again_); }
    else term.put_char(c);
  }
  term.save_position();
  for (char32_t c : tail_) {
    if (is_newline(c)) { term.put_text("\r\n"); write_prompt(term, again_); }
    else term.put_char(c);
  }
  term.restore_position();
}

void Editor::insert(char32_t ch, ITerminal& term) {
  // nothing after the cursor: a line break only needs a fresh prompt below
  if (tail_.empty()) {
    head_.push_back(ch);
    if (is_newline(ch)) {
      term.put_text("\r\n");
      print_head(term);
    } else {
      term.put_char(ch);
    }
    return;
  }
  if (is_newline(ch)) {
    undraw(term);
    head_.push_back(ch);
    redraw(term);
    return;
  }
  head_.push_back(ch);
  term.put_char(ch);
  print_tail(term);
}

void Editor::insert_text(std::u32string_view text, ITerminal& term) {
  for (char32_t c : text) insert(c, term);
}

std::optional<char32_t> Editor::erase_before(ITerminal& term) {
  if (head_.empty()) return std::nullopt;
  char32_t c = head_.back();
  if (is_newline(c)) {
    undraw(term);
    head_.pop_back();
    redraw(term);
    return c;
  }
  head_.pop_back();
  term.move_left(char_width(c));
  print_tail(term);
  return c;
}

std::optional<char32_t> Editor::erase_after(ITerminal& term) {
  if (tail_.empty()) return std::nullopt;
  char32_t c = tail_.front();
  if (is_newline(c)) {
    undraw(term);
    tail_.pop_front();
    redraw(term);
    return c;
  }
  tail_.pop_front();
  print_tail(term);
  return c;
}

void Editor::erase_word(ITerminal& term) {
  while (auto c = erase_before(term)) {
    if (is_space(*c)) break;
  }
}

void Editor::submit(ITerminal& term) {
  buffer_end(term);
  head_.push_back(U'\n');
  term.put_text("\r\n");
}

void Editor::restore(const std::string& text, ITerminal& term) {
  undraw(term);
  clear();
  for (char32_t c : utf8_to_u32(text)) head_.push_back(c);
  redraw(term);
}

void Editor::clear() {
  head_.clear();
  tail_.clear();
}

bool Editor::back(ITerminal& term) {
  if (head_.empty()) return false;
  char32_t c = head_.back();
  if (is_newline(c)) {
    undraw(term);
    head_.pop_back();
    tail_.push_front(c);
    redraw(term);
  } else {
    head_.pop_back();
    tail_.push_front(c);
    term.move_left(char_width(c));
  }
  return true;
}

bool Editor::forward(ITerminal& term) {
  if (tail_.empty()) return false;
  char32_t c = tail_.front();
  if (is_newline(c)) {
    undraw(term);
    tail_.pop_front();
    head_.push_back(c);
    redraw(term);
  } else {
    tail_.pop_front();
    head_.push_back(c);
    term.move_right(char_width(c));
  }
  return true;
}

void Editor::line_start(ITerminal& term) {
  while (!at_line_start()) back(term);
}

void Editor::line_end(ITerminal& term) {
  while (!at_line_end()) forward(term);
}

void Editor::word_back(ITerminal& term) {
  if (head_.empty()) return;
  bool cls = is_word(head_.back());
  do {
    back(term);
  } while (!head_.empty() && is_word(head_.back()) == cls);
}

void Editor::word_forward(ITerminal& term) {
  if (tail_.empty()) return;
  bool cls = is_word(tail_.front());
  do {
    forward(term);
  } while (!tail_.empty() && is_word(tail_.front()) == cls);
}

void Editor::buffer_start(ITerminal& term) {
  for (;;) {
    line_start(term);
    if (!back(term)) break;
  }
}

void Editor::buffer_end(ITerminal& term) {
  for (;;) {
    line_end(term);
    if (!forward(term)) break;
  }
}

void Editor::cursor_up(ITerminal& term) {
  if (!head_has_newline()) { line_start(term); return; }
  size_t col = column();
  line_start(term);
  back(term);
  line_start(term);
  for (size_t i = 0; i < col && !at_line_end(); ++i) forward(term);
  ML_LOG("cursor up, column %zu -> %zu", col, column());
}

void Editor::cursor_down(ITerminal& term) {
  if (std::find(tail_.begin(), tail_.end(), U'\n') == tail_.end()) { line_end(term); return; }
  size_t col = column();
  line_end(term);
  forward(term);
  for (size_t i = 0; i < col && !at_line_end(); ++i) forward(term);
  ML_LOG("cursor down, column %zu -> %zu", col, column());
}
