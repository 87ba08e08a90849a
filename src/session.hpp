#pragma once
/*
 * Session
 *
 * Purpose: prompts the user and reads one multi-line submission at a time.
 * Owns: the decoder, the key parser, the Editor and the History; borrows the byte source
 *       and the output sink.
 * Flow: read() decodes a character, feeds the key parser, applies the key to the Editor,
 *       flushes once, and repeats until Enter at buffer end or an error value.
 */
#include <optional>
#include <string>
#include "types.hpp"
#include "config.hpp"
#include "byte_source.hpp"
#include "iterminal.hpp"
#include "utf8.hpp"
#include "input.hpp"
#include "editor.hpp"
#include "history.hpp"

class Terminal;

class Session {
public:
  Session(IByteSource& source, ITerminal& term, const SessionConfig& cfg = SessionConfig());

  ReadResult read();
  // record the buffer in history, then clear it
  void accept();
  // clear the buffer without recording it
  void deny();

  bool print_inline(const std::string& text, std::error_code& ec);
  // clear from the start of the cursor row to the end of the screen, then flush
  bool clear_below(std::error_code& ec);
  void set_input(IByteSource& source);

  void set_color(std::string color) { editor_.set_color(std::move(color)); }
  void set_begin(std::string begin) { editor_.set_begin(std::move(begin)); }
  void set_again(std::string again) { editor_.set_again(std::move(again)); }

  const Editor& editor() const { return editor_; }
  const History& history() const { return history_; }
  // last diagnostic (ignored byte, unknown sequence, raw mode failure)
  const std::string& message() const { return message_; }

private:
  std::optional<ReadResult> dispatch(const Key& key, Terminal& raw);
  void history_up();
  void history_down();
  void diagnose(const std::string& what);

  IByteSource* source_;
  ITerminal& term_;
  Utf8Decoder decoder_;
  Input keys_;
  Editor editor_;
  History history_;
  std::string message_;
};
