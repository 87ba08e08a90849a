#include "input.hpp"
#include "config.hpp"
#include <cstdio>

std::string escape_debug(char32_t ch) {
  char buf[16];
  if (ch == 0x1b) return "\\e";
  if (ch == U'\r') return "\\r";
  if (ch == U'\n') return "\\n";
  if (ch == U'\t') return "\\t";
  if (ch < 0x20 || ch == 0x7f) { std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(ch)); return buf; }
  if (ch < 0x80) return std::string(1, static_cast<char>(ch));
  std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned>(ch));
  return buf;
}

void Input::reset() {
  state_ = State::Normal;
  params_.clear();
}

Key Input::consume(char32_t ch) {
  switch (state_) {
    case State::Normal: return normal(ch);
    case State::Escape: return escape(ch);
    case State::Csi: return csi(ch);
    case State::Ss3: return ss3(ch);
  }
  return Key{};
}

Key Input::finish(KeyKind kind, char32_t last) {
  Key k;
  k.kind = kind;
  k.ch = last;
  switch (state_) {
    case State::Normal: break;
    case State::Escape: k.seq = "\\e" + escape_debug(last); break;
    case State::Csi: k.seq = "\\e[" + params_ + escape_debug(last); break;
    case State::Ss3: k.seq = "\\eO" + escape_debug(last); break;
  }
  reset();
  return k;
}

Key Input::normal(char32_t ch) {
  switch (ch) {
    case 0x03: return finish(KeyKind::Interrupt, ch);
    case 0x04: return finish(KeyKind::EndOfTransmission, ch);
    case 0x09: return finish(KeyKind::Tab, ch);
    case 0x0A: return finish(KeyKind::LineFeed, ch);
    case 0x0D: return finish(KeyKind::Enter, ch);
    case 0x17: return finish(KeyKind::EraseWord, ch);
    case 0x08:
    case 0x7F: return finish(KeyKind::Backspace, ch);
    case 0x1B: state_ = State::Escape; return Key{};
    default: break;
  }
  if (ch < 0x20) {
    Key k = finish(KeyKind::Control, ch);
    k.seq = escape_debug(ch);
    return k;
  }
  return finish(KeyKind::Char, ch);
}

Key Input::escape(char32_t ch) {
  switch (ch) {
    case U'[': state_ = State::Csi; params_.clear(); return Key{};
    case U'O': state_ = State::Ss3; return Key{};
    case U'\r': return finish(KeyKind::Close, ch);
    default: return finish(KeyKind::Unknown, ch);
  }
}

Key Input::csi(char32_t ch) {
  if ((ch >= U'0' && ch <= U'9') || ch == U';') {
    params_.push_back(static_cast<char>(ch));
    if (params_.size() > ML_CSI_MAX_LEN) return finish(KeyKind::Unknown, ch);
    return Key{};
  }
  if (ch < 0x40 || ch > 0x7E) return finish(KeyKind::Unknown, ch);
  if (params_.empty()) {
    switch (ch) {
      case U'A': return finish(KeyKind::Up, ch);
      case U'B': return finish(KeyKind::Down, ch);
      case U'C': return finish(KeyKind::Right, ch);
      case U'D': return finish(KeyKind::Left, ch);
      case U'H': return finish(KeyKind::Home, ch);
      case U'F': return finish(KeyKind::End, ch);
      default: return finish(KeyKind::Unknown, ch);
    }
  }
  if (ch == U'~') {
    if (params_ == "3") return finish(KeyKind::Delete, ch);
    if (params_ == "5") return finish(KeyKind::BufferStart, ch);
    if (params_ == "6") return finish(KeyKind::BufferEnd, ch);
    if (params_ == "1" || params_ == "7") return finish(KeyKind::Home, ch);
    if (params_ == "4" || params_ == "8") return finish(KeyKind::End, ch);
    return finish(KeyKind::Unknown, ch);
  }
  if (params_ == "1;5") {
    switch (ch) {
      case U'C': return finish(KeyKind::WordRight, ch);
      case U'D': return finish(KeyKind::WordLeft, ch);
      default: return finish(KeyKind::Unimplemented, ch);
    }
  }
  return finish(KeyKind::Unknown, ch);
}

Key Input::ss3(char32_t ch) {
  switch (ch) {
    case U'A': return finish(KeyKind::Up, ch);
    case U'B': return finish(KeyKind::Down, ch);
    case U'C': return finish(KeyKind::Right, ch);
    case U'D': return finish(KeyKind::Left, ch);
    case U'H': return finish(KeyKind::Home, ch);
    case U'F': return finish(KeyKind::End, ch);
    default: return finish(KeyKind::Unknown, ch);
  }
}
