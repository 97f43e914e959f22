#pragma once
#include "linepump/cancellation.hpp"
#include <cstdint>
#include <future>
#include <istream>
#include <optional>
#include <string>

namespace lp {

// Transport-native "read one whole line". Resolves with nullopt at end of
// input; may throw OperationCancelled or SourceError from the future.
class LineSource {
public:
  virtual ~LineSource() = default;
  virtual std::future<std::optional<std::string>> read_line(const CancellationToken& token) = 0;
};

// std::getline on a background task. One request at a time.
class IstreamLineSource : public LineSource {
public:
  struct Config {
    char delimiter = '\n';
    bool strip_cr  = true;   // trim a trailing '\r' (CRLF input)
  };

  explicit IstreamLineSource(std::istream& in);
  IstreamLineSource(std::istream& in, Config cfg);

  std::future<std::optional<std::string>> read_line(const CancellationToken& token) override;

private:
  std::istream& in_;
  Config cfg_;
};

// Requests line N+1 before handing out line N.
class PreemptiveLineReader {
public:
  explicit PreemptiveLineReader(LineSource& src, CancellationToken token = {});
  ~PreemptiveLineReader();
  PreemptiveLineReader(const PreemptiveLineReader&) = delete;
  PreemptiveLineReader& operator=(const PreemptiveLineReader&) = delete;

  bool next(std::string& out);

  bool failed() const noexcept { return failed_; }
  bool cancelled() const noexcept { return cancelled_; }
  const std::string& error() const noexcept { return err_; }
  std::uint64_t lines() const noexcept { return lines_; }
  std::uint64_t requests() const noexcept { return requests_; }

private:
  std::future<std::optional<std::string>> request();
  void drain();

  LineSource& src_;
  CancellationToken token_;
  std::future<std::optional<std::string>> pending_;
  bool started_{false};
  bool done_{false};
  bool failed_{false};
  bool cancelled_{false};
  std::string err_;
  std::uint64_t lines_{0};
  std::uint64_t requests_{0};
};

}
