#include "terminfo.hpp"
#include "log.hpp"
#include <ncurses.h>
#include <term.h>

Terminfo::Terminfo(int fd) {
  int err = 0;
  loaded_ = (setupterm(nullptr, fd, &err) == OK);
  if (!loaded_) ML_LOG("setupterm failed (err=%d), using ANSI defaults", err);
}

static const char* lookup(const char* cap) {
  char* s = tigetstr(cap);
  if (s == nullptr || s == reinterpret_cast<char*>(-1)) return nullptr;
  return s;
}

std::string Terminfo::get(const char* cap) const {
  if (!loaded_) return std::string();
  const char* s = lookup(cap);
  return s ? std::string(s) : std::string();
}

std::string Terminfo::format(const char* cap, int n) const {
  if (!loaded_) return std::string();
  const char* s = lookup(cap);
  if (!s) return std::string();
  const char* out = tiparm(s, n);
  return out ? std::string(out) : std::string();
}
