#include "types.hpp"
#include <cstdio>

std::string ReadResult::describe() const {
  switch (status) {
    case ReadStatus::Ok: return text;
    case ReadStatus::Interrupted: return "Ctrl+C";
    case ReadStatus::EndOfTransmission: return "Ctrl+D";
    case ReadStatus::MalformedCharacter: {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "\\u{%x} is not a valid unicode codepoint", bad_code);
      return buf;
    }
    case ReadStatus::IoFailure: return io_error.message();
    case ReadStatus::EndOfInput: return "End of input";
  }
  return std::string();
}

ReadResult ReadResult::with_text(ReadStatus st, std::string text) {
  ReadResult r;
  r.status = st;
  r.text = std::move(text);
  return r;
}

ReadResult ReadResult::malformed(uint32_t code) {
  ReadResult r;
  r.status = ReadStatus::MalformedCharacter;
  r.bad_code = code;
  return r;
}

ReadResult ReadResult::io_failure(std::error_code ec) {
  ReadResult r;
  r.status = ReadStatus::IoFailure;
  r.io_error = ec;
  return r;
}

ReadResult ReadResult::end_of_input() {
  ReadResult r;
  r.status = ReadStatus::EndOfInput;
  return r;
}
