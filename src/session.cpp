#include "session.hpp"
#include "terminal.hpp"
#include "log.hpp"

static const std::u32string kIndent(ML_INDENT, ML_INDENT + sizeof(ML_INDENT) - 1);

Session::Session(IByteSource& source, ITerminal& term, const SessionConfig& cfg)
  : source_(&source),
    term_(term),
    decoder_(source),
    editor_(cfg.color, cfg.begin, cfg.again),
    history_(cfg.history_capacity) {}

void Session::set_input(IByteSource& source) {
  source_ = &source;
  decoder_.set_source(source);
  keys_.reset();
}

void Session::accept() {
  history_.accept(editor_.to_string());
  editor_.clear();
}

void Session::deny() {
  editor_.clear();
  history_.reset();
}

bool Session::print_inline(const std::string& text, std::error_code& ec) {
  editor_.print_inline(term_, text, ML_ERROR_COLOR);
  return term_.flush(ec);
}

bool Session::clear_below(std::error_code& ec) {
  term_.move_to_column(0);
  term_.clear_to_end_of_screen();
  return term_.flush(ec);
}

void Session::diagnose(const std::string& what) {
  message_ = what;
  ML_LOG("%s", what.c_str());
}

ReadResult Session::read() {
  Terminal raw(source_->fd());
  if (!raw.ok()) {
    diagnose("cannot enter raw mode: " + raw.error().message());
    return ReadResult::io_failure(raw.error());
  }
  keys_.reset();
  editor_.print_head(term_);
  for (;;) {
    std::error_code ec;
    if (!term_.flush(ec)) return ReadResult::io_failure(ec);
    DecodeResult d = decoder_.next();
    switch (d.status) {
      case DecodeStatus::Char: break;
      case DecodeStatus::End:
        keys_.reset();
        return ReadResult::end_of_input();
      case DecodeStatus::IoError:
        keys_.reset();
        ML_LOG("input failed: %s", d.ec.message().c_str());
        return ReadResult::io_failure(d.ec);
      case DecodeStatus::Malformed:
        keys_.reset();
        ML_LOG("malformed input 0x%x", d.raw);
        return ReadResult::malformed(d.raw);
    }
    Key key = keys_.consume(d.ch);
    if (key.kind == KeyKind::None) continue;
    if (auto done = dispatch(key, raw)) {
      if (!term_.flush(ec)) return ReadResult::io_failure(ec);
      return *done;
    }
  }
}

void Session::history_up() {
  auto entry = history_.recall_previous(editor_.to_string());
  if (!entry) return;
  editor_.restore(*entry, term_);
  editor_.buffer_start(term_);
}

void Session::history_down() {
  auto entry = history_.recall_next(editor_.to_string());
  if (!entry) return;
  editor_.restore(*entry, term_);
}

std::optional<ReadResult> Session::dispatch(const Key& key, Terminal& raw) {
  switch (key.kind) {
    case KeyKind::None: break;
    case KeyKind::Interrupt:
      raw.release();
      term_.put_text("\r\n");
      return ReadResult::with_text(ReadStatus::Interrupted, editor_.to_string());
    case KeyKind::EndOfTransmission:
      raw.release();
      term_.put_text("\r\n");
      return ReadResult::with_text(ReadStatus::EndOfTransmission, editor_.to_string());
    case KeyKind::Tab: editor_.insert_text(kIndent, term_); break;
    case KeyKind::LineFeed: break;
    case KeyKind::Enter:
      // Enter in the middle of the buffer only breaks the line
      if (!editor_.at_buffer_end()) { editor_.insert(U'\n', term_); break; }
      editor_.submit(term_);
      return ReadResult::with_text(ReadStatus::Ok, editor_.to_string());
    case KeyKind::EraseWord: editor_.erase_word(term_); break;
    case KeyKind::Backspace:
      if (editor_.ends_with(kIndent)) {
        for (size_t i = 0; i < kIndent.size(); ++i) editor_.erase_before(term_);
      } else {
        editor_.erase_before(term_);
      }
      break;
    case KeyKind::Control: diagnose("ignored control byte " + key.seq); break;
    case KeyKind::Char: editor_.insert(key.ch, term_); break;
    case KeyKind::Up:
      if (editor_.at_buffer_start() && history_.can_recall_previous()) history_up();
      else editor_.cursor_up(term_);
      break;
    case KeyKind::Down:
      if (editor_.at_buffer_end() && history_.can_recall_next()) history_down();
      else editor_.cursor_down(term_);
      break;
    case KeyKind::Left: editor_.back(term_); break;
    case KeyKind::Right: editor_.forward(term_); break;
    case KeyKind::Home: editor_.line_start(term_); break;
    case KeyKind::End: editor_.line_end(term_); break;
    case KeyKind::Delete: editor_.erase_after(term_); break;
    case KeyKind::BufferStart: editor_.buffer_start(term_); break;
    case KeyKind::BufferEnd: editor_.buffer_end(term_); break;
    case KeyKind::WordLeft: editor_.word_back(term_); break;
    case KeyKind::WordRight: editor_.word_forward(term_); break;
    case KeyKind::Close: return ReadResult::end_of_input();
    case KeyKind::Unimplemented: diagnose("unimplemented key sequence " + key.seq); break;
    case KeyKind::Unknown: diagnose("unknown key sequence " + key.seq); break;
  }
  return std::nullopt;
}
