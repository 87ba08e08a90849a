#include "utf8.hpp"
#include <wchar.h>

bool is_valid_scalar(uint32_t v) {
  if (v > 0x10FFFF) return false;
  if (v >= 0xD800 && v <= 0xDFFF) return false;
  return true;
}

void utf8_append(std::string& out, char32_t ch) {
  uint32_t c = static_cast<uint32_t>(ch);
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

std::string utf8_encode(char32_t ch) {
  std::string s;
  utf8_append(s, ch);
  return s;
}

std::u32string utf8_to_u32(std::string_view s) {
  StringByteSource src{std::string(s)};
  Utf8Decoder dec(src);
  std::u32string out;
  for (;;) {
    DecodeResult d = dec.next();
    if (d.status == DecodeStatus::Char) out.push_back(d.ch);
    else if (d.status == DecodeStatus::Malformed) out.push_back(U'\uFFFD');
    else break;
  }
  return out;
}

static DecodeResult stopped(const std::error_code& ec) {
  DecodeResult r;
  r.status = ec ? DecodeStatus::IoError : DecodeStatus::End;
  r.ec = ec;
  return r;
}

static DecodeResult malformed(uint32_t raw) {
  DecodeResult r;
  r.status = DecodeStatus::Malformed;
  r.raw = raw;
  return r;
}

DecodeResult Utf8Decoder::next() {
  std::error_code ec;
  auto lead = src_->next(ec);
  if (!lead) return stopped(ec);
  uint32_t start = *lead;
  uint32_t out = 0;
  int count = 0;
  if ((start & 0x80) == 0x00) { out = start; count = 0; }
  else if ((start & 0xE0) == 0xC0) { out = start & 0x1F; count = 1; }
  else if ((start & 0xF0) == 0xE0) { out = start & 0x0F; count = 2; }
  else if ((start & 0xF8) == 0xF0) { out = start & 0x07; count = 3; }
  else return malformed(start);
  for (int i = 0; i < count; ++i) {
    auto cont = src_->next(ec);
    if (!cont) return stopped(ec);
    if ((*cont & 0xC0) != 0x80) return malformed(out);
    out = (out << 6) | (*cont & 0x3F);
  }
  if (!is_valid_scalar(out)) return malformed(out);
  DecodeResult r;
  r.status = DecodeStatus::Char;
  r.ch = static_cast<char32_t>(out);
  return r;
}

int char_width(char32_t ch) {
  if (ch < 0x80) return 1;
  return ::wcwidth(static_cast<wchar_t>(ch)) == 2 ? 2 : 1;
}

int display_width(std::u32string_view s) {
  int w = 0;
  for (char32_t c : s) w += char_width(c);
  return w;
}
