#pragma once
#include <string>
/*
 * Input
 *
 * Purpose: turn decoded characters into keys, buffering escape sequences until they match.
 * States: Normal -> Escape (ESC) -> Csi (ESC [) or Ss3 (ESC O); parameter bytes accumulate
 *         in Csi until a final byte decides the key. Partial sequences never produce text.
 */

enum class KeyKind {
  None,               // sequence still pending
  Char,
  Interrupt,          // 0x03
  EndOfTransmission,  // 0x04
  Tab,
  LineFeed,
  Enter,              // 0x0D
  EraseWord,          // 0x17
  Backspace,          // 0x08, 0x7F
  Control,            // any other control byte
  Up, Down, Left, Right,
  Home, End,
  Delete,
  BufferStart, BufferEnd,
  WordLeft, WordRight,
  Close,              // ESC CR
  Unimplemented,      // recognized modifier form with no binding yet
  Unknown
};

struct Key {
  KeyKind kind = KeyKind::None;
  char32_t ch = 0;
  std::string seq;    // printable form of the sequence for diagnostics
};

class Input {
public:
  Key consume(char32_t ch);
  bool pending() const { return state_ != State::Normal; }
  void reset();
private:
  enum class State { Normal, Escape, Csi, Ss3 };
  Key normal(char32_t ch);
  Key escape(char32_t ch);
  Key csi(char32_t ch);
  Key ss3(char32_t ch);
  Key finish(KeyKind kind, char32_t last);
  State state_ = State::Normal;
  std::string params_;
};

// printable rendering of a character for diagnostics (\e, \x03, \u{..})
std::string escape_debug(char32_t ch);
