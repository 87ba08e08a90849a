#include "session.hpp"
#include "menu.hpp"
#include "ansi_terminal.hpp"
#include "byte_source.hpp"
#include "config.hpp"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <locale.h>
#include <optional>
#include <string>
#include <unistd.h>

static void load_rc(SessionConfig& cfg) {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / ".mlinerc";
  if (!std::filesystem::exists(p, ec)) return;
  std::string msg;
  if (!load_config(p, cfg, msg)) std::fprintf(stderr, "mline: %s\n", msg.c_str());
}

// evaluates one submission; returns false with err set when the text is not a number
static bool evaluate(const std::string& text, double& value, std::string& err) {
  size_t i = 0, j = text.size();
  while (i < j && std::isspace(static_cast<unsigned char>(text[i]))) i++;
  while (j > i && std::isspace(static_cast<unsigned char>(text[j - 1]))) j--;
  std::string s = text.substr(i, j - i);
  if (s.empty()) { err = "cannot parse float from empty string"; return false; }
  char* end = nullptr;
  errno = 0;
  value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) { err = "invalid float literal"; return false; }
  if (errno == ERANGE) { err = "number out of range"; return false; }
  return true;
}

static int run(Session& rl, AnsiTerminal& out) {
  ReadResult r = read_and(rl, [&out](const std::string& line, Response& resp, std::string& err) {
    double value = 0;
    if (!evaluate(line, value, err)) return false;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "-> %g\n", value);
    out.put_text(buf);
    std::error_code ec;
    if (!out.flush(ec)) { err = ec.message(); return false; }
    resp = Response::Accept;
    return true;
  });
  if (r.ok()) return 0;
  std::fprintf(stderr, "mline: %s\n", r.describe().c_str());
  return r.status == ReadStatus::EndOfInput ? 0 : 1;
}

int main(int argc, char** argv) {
  setlocale(LC_ALL, "");
  std::optional<std::filesystem::path> script;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--script" && i + 1 < argc) { script = std::filesystem::path(argv[++i]); continue; }
    std::fprintf(stderr, "usage: %s [--script FILE]\n", argv[0]);
    return 2;
  }
  SessionConfig cfg;
  load_rc(cfg);
  FdByteSource in(STDIN_FILENO);
  AnsiTerminal out(STDOUT_FILENO);
  Session rl(in, out, cfg);
  if (script) {
    // keystrokes from the file land in the buffer as pending input, then the user takes over
    std::string msg;
    std::optional<FdByteSource> preload = FdByteSource::open(*script, msg);
    if (!preload) { std::fprintf(stderr, "mline: %s\n", msg.c_str()); return 1; }
    rl.set_input(*preload);
    while (rl.read().ok()) {}
    rl.set_input(in);
  }
  return run(rl, out);
}
