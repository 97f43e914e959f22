#include "linepump/chunk_enumerator.hpp"
#include "linepump/chunk_source.hpp"
#include <stdexcept>
#include <utility>

namespace lp {

struct ChunkEnumerator::Impl {
  ChunkSource& src;
  Config cfg;
  CancellationToken token;

  ByteSequence cur;            // last read buffer; valid until advanced
  bool have{false};
  bool cur_completed{false};
  std::size_t seg{0};          // next segment of `cur` in per_segment mode

  bool is_done{false};
  bool failed{false};
  bool cancelled{false};
  std::string err;

  std::uint64_t n_reads{0};
  std::uint64_t n_blocks{0};
  std::uint64_t n_bytes{0};

  Impl(ChunkSource& s, Config c, CancellationToken t)
    : src(s), cfg(c), token(std::move(t)) {}

  void finish() {
    if (is_done) return;
    is_done = true;
    have = false;
    cur = ByteSequence{};
    try {
      src.complete();
    } catch (const std::exception& e) {
      if (!failed) { failed = true; err = e.what(); }
    }
  }

  void fail(const std::string& msg) {
    failed = true;
    err = msg;
    finish();
  }

  void stop_cancelled() {
    cancelled = true;
    finish();
  }

  // Consumes the whole current buffer. False when it was the last one.
  bool release_current() {
    if (!have) return true;
    const std::size_t n = cur.size();
    have = false;
    cur = ByteSequence{};
    src.advance(n);
    if (cur_completed) { finish(); return false; }
    return true;
  }

  bool fetch() {
    if (token.cancelled()) { stop_cancelled(); return false; }
    ReadResult r = src.read(token).get();
    ++n_reads;
    if (r.cancelled) { stop_cancelled(); return false; }
    if (r.buffer.empty()) { finish(); return false; }
    cur = std::move(r.buffer);
    cur_completed = r.completed;
    have = true;
    seg = 0;
    return true;
  }

  void yield(ByteSequence& out) {
    if (cfg.per_segment) out = ByteSequence(cur.segments()[seg++]);
    else out = cur;
    ++n_blocks;
    n_bytes += out.size();
  }

  bool pending_segment() const {
    return have && cfg.per_segment && seg < cur.segments().size();
  }
};

ChunkEnumerator::ChunkEnumerator(ChunkSource& src) : ChunkEnumerator(src, Config{}) {}

ChunkEnumerator::ChunkEnumerator(ChunkSource& src, Config cfg, CancellationToken token)
  : p_(new Impl(src, cfg, std::move(token))) {}

ChunkEnumerator::~ChunkEnumerator() {
  p_->finish();
  delete p_;
}

bool ChunkEnumerator::next(ByteSequence& out) {
  Impl& s = *p_;
  if (s.is_done) return false;
  try {
    if (s.pending_segment()) {
      if (s.token.cancelled()) { s.stop_cancelled(); return false; }
      s.yield(out);
      return true;
    }
    if (!s.release_current()) return false;
    if (!s.fetch()) return false;
    s.yield(out);
    return true;
  } catch (const std::exception& e) {
    s.fail(e.what());
    return false;
  }
}

bool ChunkEnumerator::for_each_block(const BlockCallback& cb) {
  ByteSequence b;
  while (next(b)) {
    if (!cb(b)) { close(); break; }
  }
  return !p_->failed;
}

void ChunkEnumerator::close() { p_->finish(); }

bool ChunkEnumerator::done() const noexcept { return p_->is_done; }
bool ChunkEnumerator::failed() const noexcept { return p_->failed; }
bool ChunkEnumerator::cancelled() const noexcept { return p_->cancelled; }
const std::string& ChunkEnumerator::error() const noexcept { return p_->err; }
std::uint64_t ChunkEnumerator::reads() const noexcept { return p_->n_reads; }
std::uint64_t ChunkEnumerator::blocks() const noexcept { return p_->n_blocks; }
std::uint64_t ChunkEnumerator::bytes() const noexcept { return p_->n_bytes; }

}
