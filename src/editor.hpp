#pragma once
/*
 * Editor
 *
 * Purpose: multi-line edit buffer split at the cursor into head (before) and tail (at/after).
 * Rendering: every mutation emits the smallest redraw that keeps the terminal in sync.
 * Invariant: head ++ tail is the full text; '\n' is stored inline, cursor offset == head.size().
 */
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include "iterminal.hpp"

class Editor {
public:
  Editor(std::string color, std::string begin, std::string again);

  void set_color(std::string color) { color_ = std::move(color); }
  void set_begin(std::string begin) { begin_ = std::move(begin); }
  void set_again(std::string again) { again_ = std::move(again); }
  const std::string& color() const { return color_; }
  const std::string& begin() const { return begin_; }
  const std::string& again() const { return again_; }

  const std::deque<char32_t>& head() const { return head_; }
  const std::deque<char32_t>& tail() const { return tail_; }
  std::string to_string() const;
  size_t size() const { return head_.size() + tail_.size(); }
  bool empty() const { return head_.empty() && tail_.empty(); }

  bool at_buffer_start() const { return head_.empty(); }
  bool at_buffer_end() const { return tail_.empty(); }
  bool at_line_start() const { return head_.empty() || head_.back() == U'\n'; }
  bool at_line_end() const { return tail_.empty() || tail_.front() == U'\n'; }
  bool ends_with(std::u32string_view pattern) const;
  // characters between the previous line break (or buffer start) and the cursor
  size_t column() const;

  /*rendering*/
  void prompt(ITerminal& term) const;
  void print_head(ITerminal& term) const;
  void print_tail(ITerminal& term) const;
  void print_inline(ITerminal& term, const std::string& text, const std::string& color) const;
  void undraw(ITerminal& term) const;
  void redraw(ITerminal& term) const;

  /*editing*/
  void insert(char32_t ch, ITerminal& term);
  void insert_text(std::u32string_view text, ITerminal& term);
  std::optional<char32_t> erase_before(ITerminal& term);
  std::optional<char32_t> erase_after(ITerminal& term);
  void erase_word(ITerminal& term);
  // terminates the buffer with '\n' and leaves the terminal on a fresh row, no prompt
  void submit(ITerminal& term);
  void restore(const std::string& text, ITerminal& term);
  void clear();

  /*motion*/
  bool back(ITerminal& term);
  bool forward(ITerminal& term);
  void line_start(ITerminal& term);
  void line_end(ITerminal& term);
  void word_back(ITerminal& term);
  void word_forward(ITerminal& term);
  void buffer_start(ITerminal& term);
  void buffer_end(ITerminal& term);
  void cursor_up(ITerminal& term);
  void cursor_down(ITerminal& term);

private:
  void write_prompt(ITerminal& term, const std::string& text) const;
  bool head_has_newline() const;
  std::deque<char32_t> head_;
  std::deque<char32_t> tail_;
  std::string color_;
  std::string begin_;
  std::string again_;
};
