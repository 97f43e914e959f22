#pragma once
#include "linepump/chunk_source.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace lp {

// Replays a fixed list of chunks, one new chunk per read, on top of whatever
// the reader left unconsumed. An empty chunk in the script means "nothing new
// arrived", so that read returns the previous unconsumed bytes unchanged
// (it is skipped when nothing is held).
// Once the script runs out, reads report completion.
class ScriptedChunkSource : public ChunkSource {
public:
  struct Config {
    bool fail_when_exhausted = false;  // throw SourceError instead of completing
    std::string fail_message = "scripted source failure";
    std::size_t cancel_after_reads = 0; // >0: that read resolves as cancelled
  };

  explicit ScriptedChunkSource(std::vector<std::string> chunks);
  ScriptedChunkSource(std::vector<std::string> chunks, Config cfg);

  std::future<ReadResult> read(const CancellationToken& token) override;
  using ChunkSource::advance;
  void advance(std::size_t consumed, std::size_t examined) override;
  void complete() override;

  std::size_t reads() const noexcept { return reads_; }
  std::size_t complete_calls() const noexcept { return complete_calls_; }
  const std::vector<std::size_t>& advances() const noexcept { return advances_; }
  std::size_t total_advanced() const noexcept;
  std::size_t retained() const noexcept;

private:
  std::vector<std::string> script_;
  Config cfg_;
  std::size_t next_{0};
  std::deque<std::string> held_;  // unconsumed bytes, one entry per arrival
  std::size_t head_off_{0};       // consumed prefix of held_.front()
  std::size_t last_size_{0};
  bool awaiting_advance_{false};
  std::size_t reads_{0};
  std::size_t complete_calls_{0};
  std::vector<std::size_t> advances_;
};

}
