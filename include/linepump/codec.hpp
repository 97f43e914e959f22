#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lp {

// Malformed byte sequence for the chosen encoding.
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Bytes <-> text. Decoded text is UTF-8 in char storage.
class Codec {
public:
  virtual ~Codec() = default;

  virtual std::string_view name() const noexcept = 0;

  // Text (UTF-8) to this encoding's bytes.
  virtual std::string encode(std::string_view text) const = 0;

  // Length of the decoded text in chars. Throws DecodeError.
  virtual std::size_t char_length(std::string_view bytes) const = 0;

  // Writes exactly char_length(bytes) chars to `dest`. Throws DecodeError.
  virtual void decode(std::string_view bytes, char* dest) const = 0;
};

class Utf8Codec : public Codec {
public:
  std::string_view name() const noexcept override { return "utf-8"; }
  std::string encode(std::string_view text) const override;
  std::size_t char_length(std::string_view bytes) const override;
  void decode(std::string_view bytes, char* dest) const override;
};

class Latin1Codec : public Codec {
public:
  std::string_view name() const noexcept override { return "latin1"; }
  std::string encode(std::string_view text) const override;
  std::size_t char_length(std::string_view bytes) const override;
  void decode(std::string_view bytes, char* dest) const override;
};

const Codec& utf8();
const Codec& latin1();

// "utf-8" | "utf8" | "latin1" | "iso-8859-1" (case-insensitive); null otherwise.
const Codec* codec_for(std::string_view name);

// "\r\n" on Windows, "\n" elsewhere.
std::string_view platform_newline() noexcept;

}
