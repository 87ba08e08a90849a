#pragma once
/*
 * Terminfo
 *
 * Purpose: look up control strings for the output terminal through ncurses' terminfo layer.
 * Note: term.h defines macros for every capability name, so it stays inside terminfo.cpp.
 */
#include <string>

class Terminfo {
public:
  // loads the entry for $TERM bound to fd; loaded() reports whether it was found
  explicit Terminfo(int fd);
  bool loaded() const { return loaded_; }
  // raw capability string, empty when the entry lacks it
  std::string get(const char* cap) const;
  // capability expanded with one numeric parameter, empty when missing
  std::string format(const char* cap, int n) const;
private:
  bool loaded_ = false;
};
