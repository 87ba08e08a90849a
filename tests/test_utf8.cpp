#include "utf8.hpp"
#include "byte_source.hpp"
#include <cassert>
#include <cerrno>
#include <string>

static DecodeResult decode_one(const std::string& bytes) {
  StringByteSource src(bytes);
  Utf8Decoder dec(src);
  return dec.next();
}

static void test_round_trip() {
  const char32_t samples[] = {U'a', U'~', 0xE9, 0x20AC, 0x1F600, 0x10FFFF};
  for (char32_t c : samples) {
    std::string enc = utf8_encode(c);
    DecodeResult d = decode_one(enc);
    assert(d.status == DecodeStatus::Char);
    assert(d.ch == c);
  }
  assert(utf8_encode(0x20AC) == "\xE2\x82\xAC");
}

static void test_sequence_consumes_exact_bytes() {
  StringByteSource src("a\xC3\xA9" "b");
  Utf8Decoder dec(src);
  assert(dec.next().ch == U'a');
  DecodeResult e = dec.next();
  assert(e.status == DecodeStatus::Char && e.ch == 0xE9);
  assert(src.remaining() == 1);
  assert(dec.next().ch == U'b');
  assert(dec.next().status == DecodeStatus::End);
  assert(dec.next().status == DecodeStatus::End);
}

static void test_truncated_is_end() {
  assert(decode_one("\xE2\x82").status == DecodeStatus::End);
  assert(decode_one("\xF0").status == DecodeStatus::End);
  assert(decode_one("").status == DecodeStatus::End);
}

static void test_bad_continuation() {
  DecodeResult d = decode_one("\xE2\x41\x42");
  assert(d.status == DecodeStatus::Malformed);
  assert(d.raw == 0x2);
  d = decode_one("\xF0\x9F\x41");
  assert(d.status == DecodeStatus::Malformed);
  assert(d.raw == 0x1F);
}

static void test_bad_lead_and_surrogate() {
  DecodeResult d = decode_one("\x80");
  assert(d.status == DecodeStatus::Malformed && d.raw == 0x80);
  d = decode_one("\xFF");
  assert(d.status == DecodeStatus::Malformed && d.raw == 0xFF);
  d = decode_one("\xED\xA0\x80");
  assert(d.status == DecodeStatus::Malformed && d.raw == 0xD800);
}

class FailingSource : public IByteSource {
public:
  std::optional<unsigned char> next(std::error_code& ec) override {
    if (sent_++ == 0) { ec.clear(); return static_cast<unsigned char>(0xC3); }
    ec = std::error_code(EIO, std::system_category());
    return std::nullopt;
  }
private:
  int sent_ = 0;
};

static void test_io_error_stops_decoding() {
  FailingSource src;
  Utf8Decoder dec(src);
  DecodeResult d = dec.next();
  assert(d.status == DecodeStatus::IoError);
  assert(d.ec.value() == EIO);
}

static void test_to_u32() {
  assert(utf8_to_u32("h\xC3\xA9") == std::u32string(U"h\u00e9"));
  assert(utf8_to_u32("a\x80" "b") == std::u32string(U"a\uFFFDb"));
}

static void test_swap_source_between_characters() {
  StringByteSource first("a\xC3\xA9");
  StringByteSource second("z");
  Utf8Decoder dec(first);
  assert(&dec.source() == &first);
  assert(dec.next().ch == U'a');
  dec.set_source(second);
  assert(&dec.source() == &second);
  DecodeResult d = dec.next();
  assert(d.status == DecodeStatus::Char && d.ch == U'z');
  assert(dec.next().status == DecodeStatus::End);
  assert(first.remaining() == 2);
}

int main() {
  test_round_trip();
  test_sequence_consumes_exact_bytes();
  test_truncated_is_end();
  test_bad_continuation();
  test_bad_lead_and_surrogate();
  test_io_error_stops_decoding();
  test_to_u32();
  test_swap_source_between_characters();
  return 0;
}
