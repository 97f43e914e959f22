#pragma once
#include "linepump/byte_sequence.hpp"
#include "linepump/cancellation.hpp"
#include <cstddef>
#include <future>
#include <stdexcept>
#include <string>

namespace lp {

// Failure reported by a transport (read error, writer failure, HTTP error).
class SourceError : public std::runtime_error {
public:
  explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

struct ReadResult {
  ByteSequence buffer;     // everything not yet consumed; valid until advance()
  bool completed = false;  // no more bytes will ever arrive
  bool cancelled = false;  // the pending read was cancelled
};

// Pull-based provider of byte chunks.
//
// Protocol: read() -> advance() -> read() ... -> complete().
// `consumed` bytes may be reclaimed by the source; `examined` tells the source
// how far the reader looked. A read resolves only once there are bytes beyond
// the examined marker, so advancing with examined == consumed makes the next
// read return the same unconsumed bytes again.
class ChunkSource {
public:
  virtual ~ChunkSource() = default;

  virtual std::future<ReadResult> read(const CancellationToken& token) = 0;
  virtual void advance(std::size_t consumed, std::size_t examined) = 0;
  void advance(std::size_t consumed) { advance(consumed, consumed); }

  // Reader is done; idempotent.
  virtual void complete() = 0;
};

}
