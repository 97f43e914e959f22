#include "linepump/preemptive_line_reader.hpp"
#include "linepump/chunk_source.hpp"

namespace lp {

IstreamLineSource::IstreamLineSource(std::istream& in) : IstreamLineSource(in, Config{}) {}

IstreamLineSource::IstreamLineSource(std::istream& in, Config cfg) : in_(in), cfg_(cfg) {}

std::future<std::optional<std::string>> IstreamLineSource::read_line(const CancellationToken& token) {
  return std::async(std::launch::async, [this, token]() -> std::optional<std::string> {
    token.throw_if_cancelled();
    std::string s;
    if (!std::getline(in_, s, cfg_.delimiter)) {
      if (in_.bad()) throw SourceError("stream read failed");
      return std::nullopt;
    }
    if (cfg_.strip_cr && !s.empty() && s.back() == '\r') s.pop_back();
    return s;
  });
}

PreemptiveLineReader::PreemptiveLineReader(LineSource& src, CancellationToken token)
  : src_(src), token_(std::move(token)) {}

PreemptiveLineReader::~PreemptiveLineReader() { drain(); }

std::future<std::optional<std::string>> PreemptiveLineReader::request() {
  std::promise<std::optional<std::string>> none;
  if (token_.cancelled()) {
    cancelled_ = true;
    none.set_value(std::nullopt);
    return none.get_future();
  }
  ++requests_;
  return src_.read_line(token_);
}

void PreemptiveLineReader::drain() {
  if (pending_.valid()) pending_.wait();
  pending_ = {};
  done_ = true;
}

bool PreemptiveLineReader::next(std::string& out) {
  if (done_) return false;
  try {
    if (!started_) {
      started_ = true;
      pending_ = request();
    }

    std::optional<std::string> line;
    try {
      line = pending_.get();
    } catch (const OperationCancelled&) {
      cancelled_ = true;
      line.reset();
    }
    if (!line) {
      drain();
      return false;
    }

    // preemptive request before yielding
    pending_ = request();
    out = std::move(*line);
    ++lines_;
    return true;
  } catch (const std::exception& e) {
    failed_ = true;
    err_ = e.what();
    drain();
    return false;
  }
}

}
