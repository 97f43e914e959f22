#include "linepump/scripted_source.hpp"
#include <numeric>
#include <stdexcept>

namespace lp {

ScriptedChunkSource::ScriptedChunkSource(std::vector<std::string> chunks)
  : ScriptedChunkSource(std::move(chunks), Config{}) {}

ScriptedChunkSource::ScriptedChunkSource(std::vector<std::string> chunks, Config cfg)
  : script_(std::move(chunks)), cfg_(std::move(cfg)) {}

std::future<ReadResult> ScriptedChunkSource::read(const CancellationToken& token) {
  if (awaiting_advance_) throw std::logic_error("ScriptedChunkSource::read while a read is outstanding");
  ++reads_;

  std::promise<ReadResult> p;
  ReadResult r;
  if (token.cancelled() || (cfg_.cancel_after_reads && reads_ == cfg_.cancel_after_reads)) {
    r.cancelled = true;
    p.set_value(std::move(r));
    return p.get_future();
  }

  // an empty chunk with nothing held would read as end of data; skip it
  while (next_ < script_.size() && script_[next_].empty() && retained() == 0) ++next_;

  if (next_ < script_.size()) {
    const std::string& c = script_[next_++];
    if (!c.empty()) held_.push_back(c);
  } else if (cfg_.fail_when_exhausted) {
    p.set_exception(std::make_exception_ptr(SourceError(cfg_.fail_message)));
    return p.get_future();
  } else {
    r.completed = true;
  }

  for (std::size_t i = 0; i < held_.size(); ++i) {
    std::string_view s(held_[i]);
    if (i == 0) s.remove_prefix(head_off_);
    r.buffer.push_back(s);
  }
  last_size_ = r.buffer.size();
  awaiting_advance_ = true;
  p.set_value(std::move(r));
  return p.get_future();
}

void ScriptedChunkSource::advance(std::size_t consumed, std::size_t examined) {
  if (!awaiting_advance_) throw std::logic_error("ScriptedChunkSource::advance without a preceding read");
  if (consumed > examined || examined > last_size_)
    throw std::logic_error("ScriptedChunkSource::advance out of range");

  advances_.push_back(consumed);
  std::size_t left = consumed;
  while (left > 0 && !held_.empty()) {
    const std::size_t avail = held_.front().size() - head_off_;
    if (left < avail) { head_off_ += left; left = 0; break; }
    left -= avail;
    held_.pop_front();
    head_off_ = 0;
  }
  awaiting_advance_ = false;
}

void ScriptedChunkSource::complete() {
  ++complete_calls_;
  held_.clear();
  head_off_ = 0;
  awaiting_advance_ = false;
}

std::size_t ScriptedChunkSource::total_advanced() const noexcept {
  return std::accumulate(advances_.begin(), advances_.end(), std::size_t{0});
}

std::size_t ScriptedChunkSource::retained() const noexcept {
  std::size_t n = 0;
  for (auto& s : held_) n += s.size();
  return n - head_off_;
}

}
