#include "linepump/pipe.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace lp {

namespace {

std::future<ReadResult> ready_future(ReadResult r) {
  std::promise<ReadResult> p;
  p.set_value(std::move(r));
  return p.get_future();
}

}

Pipe::Pipe() : Pipe(Config{}) {}

Pipe::Pipe(Config cfg) : cfg_(cfg) {
  if (!cfg_.pool) cfg_.pool = &BufferPool::shared();
  if (cfg_.segment_bytes == 0) cfg_.segment_bytes = 1;
}

Pipe::~Pipe() = default;

bool Pipe::ready_locked() const {
  return size_ > examined_ || writer_done_;
}

ReadResult Pipe::snapshot_locked() {
  ReadResult r;
  for (auto& s : segs_) {
    if (s.end > s.begin) {
      r.buffer.push_back(std::string_view(s.buf.data() + s.begin, s.end - s.begin));
    }
  }
  r.completed = writer_done_;
  last_read_size_ = size_;
  awaiting_advance_ = true;
  return r;
}

void Pipe::resolve_pending_locked() {
  if (!has_pending_) return;
  if (failed_) {
    has_pending_ = false;
    pending_.set_exception(std::make_exception_ptr(SourceError(fail_msg_)));
    return;
  }
  if (!ready_locked()) return;
  has_pending_ = false;
  pending_.set_value(snapshot_locked());
}

bool Pipe::write(std::string_view bytes) {
  std::unique_lock<std::mutex> lk(mu_);
  if (reader_done_) return false;
  if (writer_done_ || failed_) throw std::logic_error("Pipe::write after writer completed");

  while (!bytes.empty()) {
    // backpressure: hold off while the reader has unexamined bytes past the threshold
    room_.wait(lk, [&] {
      return reader_done_ || cfg_.pause_writer_bytes == 0 ||
             size_ < cfg_.pause_writer_bytes || examined_ >= size_;
    });
    if (reader_done_) return false;

    if (segs_.empty() || segs_.back().end == segs_.back().cap) {
      Segment s;
      s.buf = cfg_.pool->rent(cfg_.segment_bytes);
      s.cap = cfg_.segment_bytes;
      segs_.push_back(std::move(s));
    }
    Segment& tail = segs_.back();
    const std::size_t n = std::min(bytes.size(), tail.cap - tail.end);
    std::memcpy(tail.buf.data() + tail.end, bytes.data(), n);
    tail.end += n;
    size_ += n;
    written_ += n;
    bytes.remove_prefix(n);
    resolve_pending_locked();
  }
  return true;
}

void Pipe::complete_writer() {
  std::lock_guard<std::mutex> lk(mu_);
  writer_done_ = true;
  resolve_pending_locked();
}

void Pipe::fail_writer(std::string message) {
  std::lock_guard<std::mutex> lk(mu_);
  failed_ = true;
  fail_msg_ = std::move(message);
  resolve_pending_locked();
}

std::future<ReadResult> Pipe::read(const CancellationToken& token) {
  std::lock_guard<std::mutex> lk(mu_);
  if (reader_done_) throw std::logic_error("Pipe::read after complete");
  if (awaiting_advance_ || has_pending_) throw std::logic_error("Pipe::read while a read is outstanding");

  if (token.cancelled()) {
    ReadResult r;
    r.cancelled = true;
    return ready_future(std::move(r));
  }
  if (failed_) {
    std::promise<ReadResult> p;
    p.set_exception(std::make_exception_ptr(SourceError(fail_msg_)));
    return p.get_future();
  }
  if (ready_locked()) return ready_future(snapshot_locked());

  pending_ = std::promise<ReadResult>();
  has_pending_ = true;
  return pending_.get_future();
}

void Pipe::advance(std::size_t consumed, std::size_t examined) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!awaiting_advance_) throw std::logic_error("Pipe::advance without a preceding read");
  if (consumed > examined) throw std::logic_error("Pipe::advance consumed past examined");
  if (examined > last_read_size_) throw std::logic_error("Pipe::advance past the end of the read buffer");

  std::size_t left = consumed;
  while (left > 0 && !segs_.empty()) {
    Segment& head = segs_.front();
    if (head.begin == head.end) {
      if (segs_.size() == 1) break;
      segs_.pop_front();
      continue;
    }
    const std::size_t n = std::min(left, head.end - head.begin);
    head.begin += n;
    left -= n;
    // keep a partly written tail segment; the writer may still fill it
    if (head.begin == head.end && (segs_.size() > 1 || head.end == head.cap)) {
      segs_.pop_front();
    }
  }
  size_ -= consumed;
  examined_ = examined - consumed;
  awaiting_advance_ = false;
  room_.notify_all();
}

void Pipe::complete() {
  std::lock_guard<std::mutex> lk(mu_);
  if (reader_done_) return;
  reader_done_ = true;
  awaiting_advance_ = false;
  segs_.clear();
  size_ = 0;
  examined_ = 0;
  if (has_pending_) {
    has_pending_ = false;
    ReadResult r;
    r.completed = true;
    pending_.set_value(std::move(r));
  }
  room_.notify_all();
}

bool Pipe::cancel_pending_read() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!has_pending_) return false;
  has_pending_ = false;
  ReadResult r;
  r.cancelled = true;
  pending_.set_value(std::move(r));
  return true;
}

std::size_t Pipe::buffered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return size_;
}

std::uint64_t Pipe::bytes_written() const {
  std::lock_guard<std::mutex> lk(mu_);
  return written_;
}

bool Pipe::reader_completed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return reader_done_;
}

CancelWatch::CancelWatch(Pipe& pipe, CancellationToken token, std::chrono::milliseconds poll)
  : pipe_(pipe), token_(std::move(token)), poll_(poll) {
  task_ = std::async(std::launch::async, [this]() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!cv_.wait_for(lk, poll_, [this] { return stop_; })) {
      // keep trying: the reader may issue its read after the first attempt
      if (token_.cancelled() && pipe_.cancel_pending_read()) ++wakeups_;
    }
  });
}

CancelWatch::~CancelWatch() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (task_.valid()) task_.wait();
}

}
