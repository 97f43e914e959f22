#pragma once
#include "linepump/cancellation.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace lp {

class ChunkSource;
class Codec;

// Splits the byte stream of a ChunkSource into decoded lines, whatever the
// chunk boundaries are. Single consumer; not restartable.
class LineSplitter {
public:
  struct Config {
    std::string  delimiter;              // raw bytes; empty -> encoded platform newline
    const Codec* codec = nullptr;        // null -> UTF-8
    bool         owned_lines = false;    // keep every line alive until destruction
    std::size_t  reserve_bytes = 1024;   // initial holdover/line capacity
  };

  enum class State { AwaitingChunk, Scanning, FlushFinal, Done };

  explicit LineSplitter(ChunkSource& src);
  LineSplitter(ChunkSource& src, Config cfg, CancellationToken token = {});
  ~LineSplitter();
  LineSplitter(const LineSplitter&) = delete;
  LineSplitter& operator=(const LineSplitter&) = delete;

  // Next line, or false at the end of the sequence (see failed()/cancelled()).
  // Unless owned_lines is set, `out` is valid only until the next call.
  bool next(std::string_view& out);

  // Stop early by returning false from the callback.
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  // Ends the sequence now; holdover is discarded, the source is completed.
  void close();

  State state() const noexcept;
  bool failed() const noexcept;
  bool cancelled() const noexcept;
  const std::string& error() const noexcept;

  std::uint64_t lines() const noexcept;
  std::uint64_t bytes_consumed() const noexcept;
  std::uint64_t starvations() const noexcept;
  std::size_t holdover_high_water() const noexcept;
  const std::string& delimiter() const noexcept;

private:
  struct Impl; Impl* p_;
};

const char* to_string(LineSplitter::State s) noexcept;

}
