#include "linepump/codec.hpp"
#include <simdjson.h>
#include <cctype>
#include <cstring>

namespace lp {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static void require_utf8(std::string_view bytes) {
  if (!simdjson::validate_utf8(bytes.data(), bytes.size()))
    throw DecodeError("invalid UTF-8 sequence");
}

std::string Utf8Codec::encode(std::string_view text) const {
  require_utf8(text);
  return std::string(text);
}

std::size_t Utf8Codec::char_length(std::string_view bytes) const {
  require_utf8(bytes);
  return bytes.size();
}

void Utf8Codec::decode(std::string_view bytes, char* dest) const {
  require_utf8(bytes);
  if (!bytes.empty()) std::memcpy(dest, bytes.data(), bytes.size());
}

std::string Latin1Codec::encode(std::string_view text) const {
  require_utf8(text);
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) { out.push_back(static_cast<char>(c)); continue; }
    // two-byte sequences C2/C3 cover U+0080..U+00FF
    if ((c == 0xC2 || c == 0xC3) && i + 1 < text.size()) {
      const unsigned char c2 = static_cast<unsigned char>(text[++i]);
      out.push_back(static_cast<char>(((c & 0x03) << 6) | (c2 & 0x3F)));
      continue;
    }
    throw DecodeError("text not representable in latin1");
  }
  return out;
}

std::size_t Latin1Codec::char_length(std::string_view bytes) const {
  std::size_t n = bytes.size();
  for (unsigned char c : bytes) if (c >= 0x80) ++n;
  return n;
}

void Latin1Codec::decode(std::string_view bytes, char* dest) const {
  for (unsigned char c : bytes) {
    if (c < 0x80) { *dest++ = static_cast<char>(c); continue; }
    *dest++ = static_cast<char>(0xC0 | (c >> 6));
    *dest++ = static_cast<char>(0x80 | (c & 0x3F));
  }
}

const Codec& utf8() {
  static const Utf8Codec c;
  return c;
}

const Codec& latin1() {
  static const Latin1Codec c;
  return c;
}

const Codec* codec_for(std::string_view name) {
  if (ieq(name, "utf-8") || ieq(name, "utf8")) return &utf8();
  if (ieq(name, "latin1") || ieq(name, "iso-8859-1") || ieq(name, "latin-1")) return &latin1();
  return nullptr;
}

std::string_view platform_newline() noexcept {
#if defined(_WIN32)
  return "\r\n";
#else
  return "\n";
#endif
}

}
