#include "editor.hpp"
#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <cassert>
#include <clocale>
#include <cstdint>
#include <string>
#include <vector>

static Editor make_editor(HeadlessTerminal& t) {
  Editor ed("", ">", "?");
  ed.print_head(t);
  return ed;
}

static void type(Editor& ed, HeadlessTerminal& t, const std::u32string& s) {
  for (char32_t c : s) ed.insert(c, t);
}

static std::u32string text_of(const Editor& ed) {
  std::u32string s(ed.head().begin(), ed.head().end());
  s.append(ed.tail().begin(), ed.tail().end());
  return s;
}

// expected screen for text drawn with the ">" / "?" prompts
static std::vector<std::string> rendered(const std::u32string& text) {
  std::vector<std::string> rows;
  std::string row = "> ";
  for (char32_t c : text) {
    if (c == U'\n') { rows.push_back(row); row = "? "; continue; }
    utf8_append(row, c);
  }
  rows.push_back(row);
  for (auto& r : rows) while (!r.empty() && r.back() == ' ') r.pop_back();
  return rows;
}

static void test_insert_and_newline() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"ab\ncd");
  assert(ed.to_string() == "ab\ncd");
  assert(t.screen() == (std::vector<std::string>{"> ab", "? cd"}));
  assert(t.cursor_row() == 1 && t.cursor_col() == 4);
  assert(ed.column() == 2);
}

static void test_insert_mid_line() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"abd");
  ed.back(t);
  ed.insert(U'c', t);
  assert(ed.to_string() == "abcd");
  assert(ed.head().size() == 3 && ed.tail().size() == 1);
  assert(t.screen() == (std::vector<std::string>{"> abcd"}));
  assert(t.cursor_col() == 5);
}

static void test_break_and_join_line() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"abcd");
  ed.back(t);
  ed.back(t);
  ed.insert(U'\n', t);
  assert(t.screen() == (std::vector<std::string>{"> ab", "? cd"}));
  assert(t.cursor_row() == 1 && t.cursor_col() == 2);
  auto c = ed.erase_before(t);
  assert(c && *c == U'\n');
  assert(t.screen() == (std::vector<std::string>{"> abcd"}));
  assert(t.cursor_row() == 0 && t.cursor_col() == 4);
}

static void test_erase_after() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"ab\ncd");
  ed.buffer_start(t);
  assert(ed.at_buffer_start());
  assert(ed.erase_after(t) == std::optional<char32_t>(U'a'));
  assert(t.screen() == (std::vector<std::string>{"> b", "? cd"}));
  ed.forward(t);
  assert(ed.erase_after(t) == std::optional<char32_t>(U'\n'));
  assert(t.screen() == (std::vector<std::string>{"> bcd"}));
  ed.buffer_end(t);
  assert(!ed.erase_after(t));
  assert(ed.to_string() == "bcd");
}

static void test_erase_before_empty() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  assert(!ed.erase_before(t));
  assert(ed.empty());
}

static void test_word_motion() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"foo, bar");
  ed.word_back(t);
  assert(std::u32string(ed.tail().begin(), ed.tail().end()) == U"bar");
  assert(t.cursor_col() == 7);
  ed.line_start(t);
  ed.word_forward(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"foo");
  ed.word_forward(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"foo, ");
  assert(t.screen() == (std::vector<std::string>{"> foo, bar"}));
}

static void test_cursor_up_down_keeps_column() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"hello\nhi\nworld");
  ed.cursor_up(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"hello\nhi");
  // column was clamped to 2 on the shorter line
  ed.cursor_up(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"he");
  ed.cursor_down(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"hello\nhi");
  assert(t.cursor_row() == 1 && t.cursor_col() == 4);
  ed.cursor_down(t);
  assert(std::u32string(ed.head().begin(), ed.head().end()) == U"hello\nhi\nwo");
  assert(t.cursor_row() == 2 && t.cursor_col() == 4);
  // last line: moves to its end
  ed.cursor_down(t);
  assert(ed.at_buffer_end());
  ed.buffer_start(t);
  ed.forward(t);
  // first line: moves to its start
  ed.cursor_up(t);
  assert(ed.at_buffer_start());
  assert(t.screen() == rendered(U"hello\nhi\nworld"));
  assert(t.cursor_row() == 0 && t.cursor_col() == 2);
}

static void test_restore() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"one\ntwo");
  ed.restore("x\ny\nz", t);
  assert(ed.to_string() == "x\ny\nz");
  assert(ed.at_buffer_end());
  assert(t.screen() == (std::vector<std::string>{"> x", "? y", "? z"}));
  assert(t.cursor_row() == 2 && t.cursor_col() == 3);
}

static void test_erase_word() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"foo bar");
  ed.erase_word(t);
  assert(ed.to_string() == "foo");
  ed.erase_word(t);
  assert(ed.empty());
  assert(t.screen() == (std::vector<std::string>{">"}));
}

static void test_ends_with() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"x    ");
  assert(ed.ends_with(U"    "));
  assert(!ed.ends_with(U"x     "));
  ed.back(t);
  assert(!ed.ends_with(U"    "));
  assert(ed.ends_with(U""));
}

static void test_predicates() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  assert(ed.at_buffer_start() && ed.at_buffer_end() && ed.at_line_start() && ed.at_line_end());
  type(ed, t, U"a\nb");
  ed.back(t);
  assert(ed.at_line_start() && !ed.at_buffer_start());
  ed.back(t);
  assert(ed.at_line_end() && !ed.at_buffer_end());
}

static void test_submit_and_inline_message() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"1x");
  ed.submit(t);
  assert(ed.to_string() == "1x\n");
  assert(t.cursor_row() == 1 && t.cursor_col() == 0);
  int colors = t.color_changes();
  ed.print_inline(t, "bad", "");
  assert(t.color_changes() == colors + 2);
  assert(t.screen() == (std::vector<std::string>{"> 1x bad"}));
  assert(t.cursor_row() == 1 && t.cursor_col() == 0);
  ed.print_head(t);
  assert(t.row_text(1) == "?");
}

static bool use_utf8_locale() {
  for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
    if (std::setlocale(LC_CTYPE, name)) return true;
  }
  return false;
}

static void test_wide_characters_take_two_columns() {
  if (!use_utf8_locale()) return;
  assert(char_width(U'\u4e2d') == 2);
  assert(char_width(U'\u00e9') == 1);
  assert(display_width(U"a\u4e2d") == 3);
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  type(ed, t, U"\u4e2d\u6587x");
  assert(t.cursor_col() == 7);
  ed.back(t);
  assert(t.cursor_col() == 6);
  ed.back(t);
  assert(t.cursor_col() == 4);
  ed.erase_before(t);
  assert(t.cursor_col() == 2);
  const std::string wen = utf8_encode(U'\u6587');
  assert(t.row_text(0) == "> " + wen + "x");
  ed.forward(t);
  assert(t.cursor_col() == 4);
  ed.submit(t);
  ed.print_inline(t, "bad", "");
  assert(t.row_text(0) == "> " + wen + "x bad");
  assert(t.cursor_row() == 1 && t.cursor_col() == 0);
  std::setlocale(LC_CTYPE, "C");
}

static void test_random_edits_keep_screen_in_sync() {
  HeadlessTerminal t;
  Editor ed = make_editor(t);
  std::u32string model;
  size_t pos = 0;
  const std::u32string alphabet = U"ab \n";
  uint32_t seed = 12345;
  auto rnd = [&seed](uint32_t n) { seed = seed * 1103515245u + 12345u; return (seed >> 16) % n; };
  for (int i = 0; i < 600; ++i) {
    switch (rnd(6)) {
      case 0:
      case 1: {
        char32_t c = alphabet[rnd(static_cast<uint32_t>(alphabet.size()))];
        ed.insert(c, t);
        model.insert(model.begin() + pos, c);
        pos++;
        break;
      }
      case 2:
        if (ed.erase_before(t)) { model.erase(pos - 1, 1); pos--; }
        break;
      case 3:
        if (ed.erase_after(t)) model.erase(pos, 1);
        break;
      case 4:
        if (ed.back(t)) pos--;
        break;
      case 5:
        if (ed.forward(t)) pos++;
        break;
    }
    assert(ed.head().size() == pos);
    assert(ed.size() == model.size());
  }
  assert(text_of(ed) == model);
  assert(t.screen() == rendered(model));
  size_t row = 0;
  for (size_t i = 0; i < pos; ++i) if (model[i] == U'\n') row++;
  assert(t.cursor_row() == static_cast<int>(row));
  assert(t.cursor_col() == static_cast<int>(2 + ed.column()));
}

int main() {
  test_insert_and_newline();
  test_insert_mid_line();
  test_break_and_join_line();
  test_erase_after();
  test_erase_before_empty();
  test_word_motion();
  test_cursor_up_down_keeps_column();
  test_restore();
  test_erase_word();
  test_ends_with();
  test_predicates();
  test_submit_and_inline_message();
  test_wide_characters_take_two_columns();
  test_random_edits_keep_screen_in_sync();
  return 0;
}
