#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight result types (ReadResult/DecodeResult).
 * Principle: carry plain values; callers match on the status, nothing is thrown.
 */
#include <cstdint>
#include <string>
#include <system_error>

enum class ReadStatus {
  Ok,                 // text holds the submitted lines
  Interrupted,        // Ctrl+C, text holds the pending buffer
  EndOfTransmission,  // Ctrl+D, text holds the pending buffer
  MalformedCharacter, // bad_code holds the rejected value
  IoFailure,          // io_error holds the source/sink failure
  EndOfInput          // byte stream exhausted, or Alt+Enter
};

struct ReadResult {
  ReadStatus status = ReadStatus::Ok;
  std::string text;
  uint32_t bad_code = 0;
  std::error_code io_error;

  bool ok() const { return status == ReadStatus::Ok; }
  std::string describe() const;

  static ReadResult with_text(ReadStatus st, std::string text);
  static ReadResult malformed(uint32_t code);
  static ReadResult io_failure(std::error_code ec);
  static ReadResult end_of_input();
};

enum class DecodeStatus { Char, Malformed, End, IoError };

struct DecodeResult {
  DecodeStatus status = DecodeStatus::End;
  char32_t ch = 0;
  uint32_t raw = 0;
  std::error_code ec;
};
