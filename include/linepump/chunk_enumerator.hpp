#pragma once
#include "linepump/byte_sequence.hpp"
#include "linepump/cancellation.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace lp {

class ChunkSource;

// Raw pass-through over a ChunkSource: every read buffer is handed out as is
// and consumed in full before the next read. With per_segment set, each
// buffer is flattened into its segments, one per call, and cancellation is
// also checked between segments. Single consumer; not restartable.
class ChunkEnumerator {
public:
  struct Config {
    bool per_segment = false;
  };

  explicit ChunkEnumerator(ChunkSource& src);
  ChunkEnumerator(ChunkSource& src, Config cfg, CancellationToken token = {});
  ~ChunkEnumerator();
  ChunkEnumerator(const ChunkEnumerator&) = delete;
  ChunkEnumerator& operator=(const ChunkEnumerator&) = delete;

  // Next block (or segment), valid until the next call. False at the end of
  // the sequence; see failed()/cancelled().
  bool next(ByteSequence& out);

  using BlockCallback = std::function<bool(const ByteSequence&)>;
  bool for_each_block(const BlockCallback& cb);

  // Ends the sequence now and completes the source.
  void close();

  bool done() const noexcept;
  bool failed() const noexcept;
  bool cancelled() const noexcept;
  const std::string& error() const noexcept;

  std::uint64_t reads() const noexcept;
  std::uint64_t blocks() const noexcept;
  std::uint64_t bytes() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
