#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lp {

// Read-only view over bytes that may live in several separate blocks.
// Positions are offsets from the start of the whole sequence.
class ByteSequence {
public:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  ByteSequence() = default;
  explicit ByteSequence(std::string_view single);
  explicit ByteSequence(std::vector<std::string_view> segments);

  void push_back(std::string_view seg);

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  const std::vector<std::string_view>& segments() const noexcept { return segs_; }

  bool is_single_segment() const noexcept { return segs_.size() <= 1; }
  // Contiguous view; only meaningful when is_single_segment().
  std::string_view first() const noexcept {
    return segs_.empty() ? std::string_view{} : segs_.front();
  }

  char at(std::size_t pos) const;

  // First occurrence of `needle` starting at or after `from`. The match may
  // cross segment boundaries.
  std::size_t find(std::string_view needle, std::size_t from = 0) const;

  // Sub-view of [from, to).
  ByteSequence slice(std::size_t from, std::size_t to) const;

  // Append bytes [from, to) to `out`.
  void append_to(std::string& out, std::size_t from, std::size_t to) const;

  std::string to_string() const;

private:
  std::vector<std::string_view> segs_;
  std::size_t size_{0};
};

}
