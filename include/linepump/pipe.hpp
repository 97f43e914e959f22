#pragma once
#include "linepump/buffer_pool.hpp"
#include "linepump/cancellation.hpp"
#include "linepump/chunk_source.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <string_view>

namespace lp {

// In-memory byte pipe. A producer thread writes, a single reader consumes it
// through the ChunkSource protocol. Storage is a list of pooled segments so
// a read hands out a segmented view without copying.
class Pipe : public ChunkSource {
public:
  struct Config {
    std::size_t segment_bytes = 4 * 1024;
    std::size_t pause_writer_bytes = 1024 * 1024; // 0 = never pause the writer
    BufferPool* pool = nullptr; // null -> BufferPool::shared()
  };

  Pipe();
  explicit Pipe(Config cfg);
  ~Pipe() override;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  // --- writer side
  // Blocks while the pipe holds pause_writer_bytes the reader has not looked at.
  // Returns false once the reader has completed; the bytes are dropped.
  bool write(std::string_view bytes);
  void complete_writer();
  void fail_writer(std::string message);

  // --- reader side
  std::future<ReadResult> read(const CancellationToken& token) override;
  using ChunkSource::advance;
  void advance(std::size_t consumed, std::size_t examined) override;
  void complete() override;

  // Resolve an outstanding read with `cancelled = true`. False if none was pending.
  bool cancel_pending_read();

  std::size_t buffered() const;
  std::uint64_t bytes_written() const;
  bool reader_completed() const;

private:
  struct Segment {
    PooledBuffer buf;
    std::size_t cap = 0;   // usable bytes; the pooled block may be larger
    std::size_t begin = 0;
    std::size_t end = 0;
  };

  ReadResult snapshot_locked();
  bool ready_locked() const;
  void resolve_pending_locked();

  Config cfg_;
  mutable std::mutex mu_;
  std::condition_variable room_;
  std::deque<Segment> segs_;
  std::size_t size_{0};          // unconsumed bytes
  std::size_t examined_{0};      // bytes from head the reader has looked at
  std::size_t last_read_size_{0};
  std::uint64_t written_{0};

  bool writer_done_{false};
  bool failed_{false};
  std::string fail_msg_;
  bool reader_done_{false};
  bool awaiting_advance_{false};

  bool has_pending_{false};
  std::promise<ReadResult> pending_;
};

// Wakes a read left pending on `pipe` once `token` is cancelled. The token
// alone is only seen before the next read, so a reader parked on an idle
// producer would otherwise wait for more input. Stops on destruction.
class CancelWatch {
public:
  CancelWatch(Pipe& pipe, CancellationToken token,
              std::chrono::milliseconds poll = std::chrono::milliseconds(20));
  ~CancelWatch();
  CancelWatch(const CancelWatch&) = delete;
  CancelWatch& operator=(const CancelWatch&) = delete;

  std::size_t wakeups() const noexcept { return wakeups_.load(); }

private:
  Pipe& pipe_;
  CancellationToken token_;
  std::chrono::milliseconds poll_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
  std::atomic<std::size_t> wakeups_{0};
  std::future<void> task_;
};

}
