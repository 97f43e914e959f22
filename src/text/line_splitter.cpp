#include "linepump/line_splitter.hpp"
#include "linepump/byte_sequence.hpp"
#include "linepump/chunk_source.hpp"
#include "linepump/codec.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace lp {

struct LineSplitter::Impl {
  ChunkSource& src;
  Config cfg;
  CancellationToken token;
  const Codec* codec{nullptr};
  std::string delim;

  State st{State::AwaitingChunk};

  // current chunk; valid until the source is advanced
  ByteSequence chunk;
  bool chunk_completed{false};
  std::size_t pos{0};             // consumed prefix of `chunk`
  std::size_t last_length{0};     // unconsumed length left after the previous chunk

  std::string holdover;           // bytes with no delimiter found yet
  std::string scratch;            // gather buffer for lines split across segments
  std::string line;               // reused decode target
  std::deque<std::string> owned;  // owned_lines storage

  bool failed{false};
  bool cancelled{false};
  bool completed_source{false};
  std::string err;

  std::uint64_t n_lines{0};
  std::uint64_t consumed{0};
  std::uint64_t starved{0};
  std::size_t hold_hw{0};

  Impl(ChunkSource& s, Config c, CancellationToken t)
    : src(s), cfg(std::move(c)), token(std::move(t)) {
    codec = cfg.codec ? cfg.codec : &utf8();
    delim = cfg.delimiter.empty() ? codec->encode(platform_newline()) : cfg.delimiter;
    if (delim.empty()) throw std::invalid_argument("LineSplitter: empty delimiter");
    holdover.reserve(cfg.reserve_bytes);
    line.reserve(cfg.reserve_bytes);
  }

  void hold(const ByteSequence& seq, std::size_t from, std::size_t to) {
    seq.append_to(holdover, from, to);
    hold_hw = std::max(hold_hw, holdover.size());
  }

  void advance_source(std::size_t n) {
    src.advance(n);
    consumed += n;
  }

  std::string_view emit(std::string_view bytes) {
    const std::size_t n = codec->char_length(bytes);
    std::string* target = &line;
    if (cfg.owned_lines) {
      owned.emplace_back();
      target = &owned.back();
    }
    target->resize(n);
    if (n) codec->decode(bytes, &(*target)[0]);
    ++n_lines;
    return std::string_view(target->data(), target->size());
  }

  void finish() {
    st = State::Done;
    chunk = ByteSequence{};
    if (completed_source) return;
    completed_source = true;
    try {
      src.complete();
    } catch (const std::exception& e) {
      if (!failed) { failed = true; err = e.what(); }
    }
  }

  void cancel() {
    holdover.clear();
    cancelled = true;
    finish();
  }

  void fail(const char* what) {
    failed = true;
    err = what;
    holdover.clear();
    finish();
  }

  // Returns false when the sequence ended without another chunk to scan.
  bool await_chunk() {
    if (token.cancelled()) { cancel(); return false; }

    ReadResult r = src.read(token).get();
    if (r.cancelled) { cancel(); return false; }

    if (r.buffer.empty()) {
      st = State::FlushFinal;
      return true;
    }

    if (!r.completed && r.buffer.size() == last_length) {
      // no forward progress: take everything into holdover and wait for more
      ++starved;
      hold(r.buffer, 0, r.buffer.size());
      advance_source(r.buffer.size());
      last_length = 0;
      return true;
    }

    chunk = std::move(r.buffer);
    chunk_completed = r.completed;
    pos = 0;
    st = State::Scanning;
    return true;
  }

  // Emits the next line of the current chunk into `out`, or hands the tail
  // back to the source and returns false.
  bool scan(std::string_view& out) {
    const std::size_t dlen = delim.size();

    if (!holdover.empty()) {
      // the delimiter may begin inside the holdover tail
      const std::size_t h = holdover.size();
      ByteSequence comb{std::string_view(holdover)};
      const ByteSequence rest = chunk.slice(pos, chunk.size());
      for (auto seg : rest.segments()) comb.push_back(seg);
      const std::size_t start = (h >= dlen - 1) ? h - (dlen - 1) : 0;
      const std::size_t m = comb.find(delim, start);
      if (m != ByteSequence::npos) {
        if (m <= h) holdover.resize(m);
        else chunk.append_to(holdover, pos, pos + (m - h));
        hold_hw = std::max(hold_hw, holdover.size());
        pos += m + dlen - h;
        out = emit(holdover);
        holdover.clear();
        return true;
      }
    } else {
      const std::size_t m = chunk.find(delim, pos);
      if (m != ByteSequence::npos) {
        ByteSequence span = chunk.slice(pos, m);
        pos = m + dlen;
        if (span.is_single_segment()) {
          out = emit(span.first());
        } else {
          scratch.clear();
          span.append_to(scratch, 0, span.size());
          out = emit(scratch);
        }
        return true;
      }
    }

    // no further delimiter in this chunk
    if (chunk_completed) {
      hold(chunk, pos, chunk.size());
      advance_source(chunk.size());
      chunk = ByteSequence{};
      st = State::FlushFinal;
      return false;
    }
    last_length = chunk.size() - pos;
    advance_source(pos);
    chunk = ByteSequence{};
    st = State::AwaitingChunk;
    return false;
  }

  bool flush_final(std::string_view& out) {
    if (holdover.empty()) { finish(); return false; }
    out = emit(holdover);
    holdover.clear();
    finish();
    return true;
  }
};

LineSplitter::LineSplitter(ChunkSource& src) : LineSplitter(src, Config{}) {}

LineSplitter::LineSplitter(ChunkSource& src, Config cfg, CancellationToken token)
  : p_(new Impl(src, std::move(cfg), std::move(token))) {}

LineSplitter::~LineSplitter() {
  p_->holdover.clear();
  p_->finish();
  delete p_;
}

bool LineSplitter::next(std::string_view& out) {
  Impl& s = *p_;
  try {
    for (;;) {
      switch (s.st) {
        case State::AwaitingChunk:
          if (!s.await_chunk()) return false;
          break;
        case State::Scanning:
          if (s.scan(out)) return true;
          break;
        case State::FlushFinal:
          return s.flush_final(out);
        case State::Done:
          return false;
      }
    }
  } catch (const std::exception& e) {
    s.fail(e.what());
    return false;
  }
}

bool LineSplitter::for_each_line(const LineCallback& cb) {
  std::string_view s;
  while (next(s)) {
    if (!cb(s)) { close(); break; }
  }
  return !p_->failed;
}

void LineSplitter::close() {
  if (p_->st == State::Done) return;
  p_->holdover.clear();
  p_->finish();
}

LineSplitter::State LineSplitter::state() const noexcept { return p_->st; }
bool LineSplitter::failed() const noexcept { return p_->failed; }
bool LineSplitter::cancelled() const noexcept { return p_->cancelled; }
const std::string& LineSplitter::error() const noexcept { return p_->err; }
std::uint64_t LineSplitter::lines() const noexcept { return p_->n_lines; }
std::uint64_t LineSplitter::bytes_consumed() const noexcept { return p_->consumed; }
std::uint64_t LineSplitter::starvations() const noexcept { return p_->starved; }
std::size_t LineSplitter::holdover_high_water() const noexcept { return p_->hold_hw; }
const std::string& LineSplitter::delimiter() const noexcept { return p_->delim; }

const char* to_string(LineSplitter::State s) noexcept {
  switch (s) {
    case LineSplitter::State::AwaitingChunk: return "awaiting_chunk";
    case LineSplitter::State::Scanning:      return "scanning";
    case LineSplitter::State::FlushFinal:    return "flush_final";
    case LineSplitter::State::Done:          return "done";
  }
  return "unknown";
}

}
