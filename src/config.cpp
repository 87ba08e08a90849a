#include "config.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <charconv>
#include <vector>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool unescape_value(const std::string& raw, std::string& out) {
  std::string s = raw;
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') s = s.substr(1, s.size() - 2);
  out.clear();
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\') { out.push_back(s[i]); continue; }
    if (++i >= s.size()) return false;
    switch (s[i]) {
      case 'e': out.push_back('\x1b'); break;
      case 't': out.push_back('\t'); break;
      case '\\': out.push_back('\\'); break;
      case '"': out.push_back('"'); break;
      case 'x': {
        int hi = (i + 1 < s.size()) ? hex_value(s[i + 1]) : -1;
        int lo = (i + 2 < s.size()) ? hex_value(s[i + 2]) : -1;
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        break;
      }
      case '0': {
        int v = 0, digits = 0;
        while (digits < 3 && i + 1 < s.size() && s[i + 1] >= '0' && s[i + 1] <= '7') {
          v = v * 8 + (s[i + 1] - '0'); ++i; ++digits;
        }
        if (digits == 0 || v > 0xff) return false;
        out.push_back(static_cast<char>(v));
        break;
      }
      default: return false;
    }
  }
  return true;
}

bool load_config(const std::filesystem::path& path, SessionConfig& cfg, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  int lineno = 0;
  for (const std::string& raw : lines) {
    ++lineno;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    auto where = [&]() { return path.string() + ":" + std::to_string(lineno) + ": "; };
    size_t eq = s.find('=');
    if (eq == std::string::npos) { msg = where() + "expected key = value"; return false; }
    std::string key = trim(s.substr(0, eq));
    std::string value;
    if (!unescape_value(trim(s.substr(eq + 1)), value)) { msg = where() + "bad escape in value"; return false; }
    if (key == "color") cfg.color = value;
    else if (key == "begin") cfg.begin = value;
    else if (key == "again") cfg.again = value;
    else if (key == "history") {
      size_t n = 0;
      auto [p, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc() || p != value.data() + value.size() || n == 0) {
        msg = where() + "history must be a positive integer";
        return false;
      }
      cfg.history_capacity = n;
    } else {
      msg = where() + "unknown key: " + key;
      return false;
    }
  }
  msg = std::string("loaded config: ") + path.string();
  return true;
}
