#include "ansi_terminal.hpp"
#include "utf8.hpp"
#include <cerrno>

static std::string or_default(std::string s, const char* ansi) {
  return s.empty() ? std::string(ansi) : s;
}

AnsiTerminal::AnsiTerminal(int fd)
  : fd_(fd), ti_(fd) {
  save_ = or_default(ti_.get("sc"), "\x1b" "7");
  restore_ = or_default(ti_.get("rc"), "\x1b" "8");
  clear_eos_ = or_default(ti_.get("ed"), "\x1b[J");
  clear_eol_ = or_default(ti_.get("el"), "\x1b[K");
  sgr0_ = or_default(ti_.get("sgr0"), "\x1b[0m");
}

void AnsiTerminal::move(const char* cap, char ansi_final, int n) {
  if (n <= 0) return;
  std::string s = ti_.format(cap, n);
  if (s.empty()) s = "\x1b[" + std::to_string(n) + ansi_final;
  out_ += s;
}

void AnsiTerminal::move_to_column(int col) {
  std::string s = ti_.format("hpa", col);
  if (s.empty()) s = "\x1b[" + std::to_string(col + 1) + "G";
  out_ += s;
}

void AnsiTerminal::move_up(int n) { move("cuu", 'A', n); }
void AnsiTerminal::move_down(int n) { move("cud", 'B', n); }
void AnsiTerminal::move_right(int n) { move("cuf", 'C', n); }
void AnsiTerminal::move_left(int n) { move("cub", 'D', n); }
void AnsiTerminal::save_position() { out_ += save_; }
void AnsiTerminal::restore_position() { out_ += restore_; }
void AnsiTerminal::clear_to_end_of_screen() { out_ += clear_eos_; }
void AnsiTerminal::clear_to_end_of_line() { out_ += clear_eol_; }
void AnsiTerminal::set_color(const std::string& code) { out_ += code; }
void AnsiTerminal::reset_color() { out_ += sgr0_; }
void AnsiTerminal::put_char(char32_t ch) { utf8_append(out_, ch); }
void AnsiTerminal::put_text(std::string_view utf8) { out_.append(utf8.data(), utf8.size()); }

bool AnsiTerminal::flush(std::error_code& ec) {
  ec.clear();
  const char* p = out_.data();
  size_t remain = out_.size();
  while (remain > 0) {
    ssize_t w = ::write(fd_, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      ec = std::error_code(errno, std::system_category());
      out_.erase(0, out_.size() - remain);
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
  out_.clear();
  return true;
}
