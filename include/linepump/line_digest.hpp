#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace lp {

// SHA-256 over a stream of lines, each followed by '\n'. Equal line sequences
// give equal digests no matter how the input was chunked.
class LineDigest {
public:
  LineDigest();
  ~LineDigest();
  LineDigest(const LineDigest&) = delete;
  LineDigest& operator=(const LineDigest&) = delete;

  void add_line(std::string_view line);
  // Raw bytes, no separator (buffer pumps).
  void add_bytes(std::string_view bytes);

  // Hex digest; finalizes, further adds start a new digest.
  std::string hex();

  std::uint64_t lines() const noexcept { return lines_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t lines_{0};
};

// One-shot helper.
std::string sha256_hex(std::string_view data);

}
