#include "linepump/byte_sequence.hpp"
#include <algorithm>
#include <stdexcept>

namespace lp {

ByteSequence::ByteSequence(std::string_view single) { push_back(single); }

ByteSequence::ByteSequence(std::vector<std::string_view> segments) {
  segs_.reserve(segments.size());
  for (auto s : segments) push_back(s);
}

void ByteSequence::push_back(std::string_view seg) {
  if (seg.empty()) return;
  segs_.push_back(seg);
  size_ += seg.size();
}

char ByteSequence::at(std::size_t pos) const {
  for (auto s : segs_) {
    if (pos < s.size()) return s[pos];
    pos -= s.size();
  }
  throw std::out_of_range("ByteSequence::at");
}

std::size_t ByteSequence::find(std::string_view needle, std::size_t from) const {
  if (needle.empty()) return from <= size_ ? from : npos;
  if (from >= size_ || size_ - from < needle.size()) return npos;

  std::size_t base = 0; // offset of segment i
  for (std::size_t i = 0; i < segs_.size(); ++i) {
    const std::string_view seg = segs_[i];
    const std::size_t seg_end = base + seg.size();
    if (seg_end <= from) { base = seg_end; continue; }

    std::size_t local = (from > base) ? from - base : 0;
    while (local < seg.size()) {
      // fast scan for the first byte inside this segment
      std::size_t hit = seg.find(needle.front(), local);
      if (hit == std::string_view::npos) break;

      // verify the rest, walking into later segments when needed
      std::size_t matched = 1;
      std::size_t si = i, off = hit + 1;
      while (matched < needle.size()) {
        while (si < segs_.size() && off >= segs_[si].size()) { off = 0; ++si; }
        if (si >= segs_.size()) return npos; // ran out of bytes
        if (segs_[si][off] != needle[matched]) break;
        ++matched; ++off;
      }
      if (matched == needle.size()) return base + hit;
      local = hit + 1;
    }
    base = seg_end;
  }
  return npos;
}

ByteSequence ByteSequence::slice(std::size_t from, std::size_t to) const {
  if (from > to || to > size_) throw std::out_of_range("ByteSequence::slice");
  ByteSequence out;
  std::size_t base = 0;
  for (auto s : segs_) {
    const std::size_t seg_end = base + s.size();
    if (seg_end > from && base < to) {
      const std::size_t a = std::max(from, base) - base;
      const std::size_t b = std::min(to, seg_end) - base;
      out.push_back(s.substr(a, b - a));
    }
    if (seg_end >= to) break;
    base = seg_end;
  }
  return out;
}

void ByteSequence::append_to(std::string& out, std::size_t from, std::size_t to) const {
  if (from > to || to > size_) throw std::out_of_range("ByteSequence::append_to");
  std::size_t base = 0;
  for (auto s : segs_) {
    const std::size_t seg_end = base + s.size();
    if (seg_end > from && base < to) {
      const std::size_t a = std::max(from, base) - base;
      const std::size_t b = std::min(to, seg_end) - base;
      out.append(s.data() + a, b - a);
    }
    if (seg_end >= to) break;
    base = seg_end;
  }
}

std::string ByteSequence::to_string() const {
  std::string out;
  out.reserve(size_);
  for (auto s : segs_) out.append(s.data(), s.size());
  return out;
}

}
