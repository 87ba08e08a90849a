#pragma once
/*
 * Utf8
 *
 * Purpose: encode code points for output; decode a byte source into characters.
 * Decoder: lazy and single pass; each next() consumes exactly one character's bytes.
 * Failure: a bad leading/continuation byte yields Malformed carrying the bits gathered so far;
 *          a stream that ends mid-character yields End, not Malformed.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include "types.hpp"
#include "byte_source.hpp"

bool is_valid_scalar(uint32_t v);
void utf8_append(std::string& out, char32_t ch);
std::string utf8_encode(char32_t ch);
// malformed sequences become U+FFFD; a truncated tail is dropped
std::u32string utf8_to_u32(std::string_view s);
// terminal columns taken by ch under the current LC_CTYPE: 2 for wide, 1 otherwise
int char_width(char32_t ch);
int display_width(std::u32string_view s);

class Utf8Decoder {
public:
  explicit Utf8Decoder(IByteSource& src) : src_(&src) {}
  DecodeResult next();
  // partial state lives only inside next(), so swapping is always safe between calls
  void set_source(IByteSource& src) { src_ = &src; }
  IByteSource& source() const { return *src_; }
private:
  IByteSource* src_;
};
