#include "linepump/chunk_enumerator.hpp"
#include "linepump/pipe.hpp"
#include "linepump/scripted_source.hpp"
#include <future>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::vector<std::string> drain(lp::ChunkEnumerator& en) {
  std::vector<std::string> out;
  lp::ByteSequence b;
  while (en.next(b)) out.push_back(b.to_string());
  return out;
}

static void blocks_pass_through_and_advance_fully() {
  lp::ScriptedChunkSource src({"ab\nc", "", "def", "g"});
  lp::ChunkEnumerator en(src);
  auto got = drain(en);
  check(got == std::vector<std::string>{"ab\nc", "def", "g"}, "blocks: one per read");
  check(src.advances() == std::vector<std::size_t>{4, 3, 1}, "blocks: each advanced to its end");
  check(src.retained() == 0 && src.complete_calls() == 1, "blocks: drained and completed once");
  check(en.done() && !en.failed() && !en.cancelled(), "blocks: clean end");
  check(en.blocks() == 3 && en.bytes() == 8 && en.reads() == 4, "blocks: counters");
}

static void empty_source_completes() {
  lp::ScriptedChunkSource src({});
  lp::ChunkEnumerator en(src);
  check(drain(en).empty(), "empty_source: nothing yielded");
  check(src.complete_calls() == 1, "empty_source: complete once");
  lp::ByteSequence b;
  check(!en.next(b) && src.complete_calls() == 1, "empty_source: stays ended");
}

static void per_segment_flattens() {
  // a pipe with tiny segments hands out multi-segment buffers
  lp::BufferPool pool(4);
  lp::Pipe::Config pc;
  pc.segment_bytes = 4;
  pc.pool = &pool;
  {
    lp::Pipe pipe(pc);
    pipe.write("abcdefghij");
    pipe.complete_writer();

    lp::ChunkEnumerator::Config ec;
    ec.per_segment = true;
    lp::ChunkEnumerator en(pipe, ec);
    std::vector<std::string> got;
    lp::ByteSequence b;
    while (en.next(b)) {
      check(b.is_single_segment(), "per_segment: one segment per call");
      got.push_back(b.to_string());
    }
    check(got == std::vector<std::string>{"abcd", "efgh", "ij"}, "per_segment: segments in order");
    check(en.reads() == 1 && !en.failed(), "per_segment: single read");
    check(pipe.reader_completed() && pipe.buffered() == 0, "per_segment: pipe completed");
  }
  check(pool.outstanding() == 0, "per_segment: segments returned");
}

static void cancel_between_segments() {
  lp::BufferPool pool(4);
  lp::Pipe::Config pc;
  pc.segment_bytes = 4;
  pc.pool = &pool;
  lp::Pipe pipe(pc);
  pipe.write("abcdefghij");

  lp::CancellationSource cs;
  lp::ChunkEnumerator::Config ec;
  ec.per_segment = true;
  lp::ChunkEnumerator en(pipe, ec, cs.token());
  lp::ByteSequence b;
  check(en.next(b) && b.to_string() == "abcd", "cancel_between_segments: first segment");
  cs.cancel();
  check(!en.next(b), "cancel_between_segments: stops at the next segment");
  check(en.cancelled() && !en.failed(), "cancel_between_segments: cancelled");
  check(pipe.reader_completed(), "cancel_between_segments: pipe completed");
  check(en.blocks() == 1, "cancel_between_segments: one yielded");
}

static void cancel_before_first_read() {
  lp::CancellationSource cs;
  cs.cancel();
  lp::ScriptedChunkSource src({"data"});
  lp::ChunkEnumerator en(src, {}, cs.token());
  lp::ByteSequence b;
  check(!en.next(b) && en.cancelled(), "cancel_before_first_read: nothing yielded");
  check(src.reads() == 0 && src.complete_calls() == 1, "cancel_before_first_read: no read, complete once");

  lp::ScriptedChunkSource::Config sc;
  sc.cancel_after_reads = 2;
  lp::ScriptedChunkSource src2({"a", "b", "c"}, sc);
  lp::ChunkEnumerator en2(src2);
  auto got = drain(en2);
  check(got == std::vector<std::string>{"a"} && en2.cancelled(), "cancelled read ends the sequence");
  check(src2.complete_calls() == 1, "cancelled read: complete once");
}

static void source_error_fails() {
  lp::ScriptedChunkSource::Config sc;
  sc.fail_when_exhausted = true;
  sc.fail_message = "disk went away";
  lp::ScriptedChunkSource src({"x", "y"}, sc);
  lp::ChunkEnumerator en(src);
  auto got = drain(en);
  check(got == std::vector<std::string>{"x", "y"}, "source_error: blocks before the error");
  check(en.failed() && en.error() == "disk went away", "source_error: message " + en.error());
  check(src.complete_calls() == 1, "source_error: complete once");
}

static void early_stop_and_destruction_complete_once() {
  lp::ScriptedChunkSource src({"1", "2", "3"});
  {
    lp::ChunkEnumerator en(src);
    int seen = 0;
    check(en.for_each_block([&](const lp::ByteSequence&) { return ++seen < 2; }), "early_stop: not failed");
    check(seen == 2 && en.done(), "early_stop: stopped after two");
  }
  check(src.complete_calls() == 1, "early_stop: complete once across close and destruction");

  lp::ScriptedChunkSource src2({"1", "2"});
  {
    lp::ChunkEnumerator en(src2);
    lp::ByteSequence b;
    en.next(b);
  }
  check(src2.complete_calls() == 1, "abandoned: destructor completes the source");
}

static void blocks_over_threaded_pipe() {
  std::string data;
  for (int i = 0; i < 20000; ++i) data += static_cast<char>('a' + i * 7 % 26);

  lp::Pipe::Config pc;
  pc.segment_bytes = 64;
  pc.pause_writer_bytes = 512;
  lp::Pipe pipe(pc);
  auto writer = std::async(std::launch::async, [&] {
    std::size_t step = 1;
    for (std::size_t at = 0; at < data.size(); at += step, step = step * 5 % 97 + 1) {
      if (!pipe.write(std::string_view(data).substr(at, step))) return;
    }
    pipe.complete_writer();
  });

  lp::ChunkEnumerator en(pipe);
  std::string got;
  en.for_each_block([&](const lp::ByteSequence& b) {
    got += b.to_string();
    return true;
  });
  writer.get();
  check(got == data, "threaded_pipe: bytes=" + std::to_string(got.size()));
  check(!en.failed() && en.bytes() == data.size(), "threaded_pipe: " + en.error());
}

int main() {
  blocks_pass_through_and_advance_fully();
  empty_source_completes();
  per_segment_flattens();
  cancel_between_segments();
  cancel_before_first_read();
  source_error_fails();
  early_stop_and_destruction_complete_once();
  blocks_over_threaded_pipe();

  if (failures) { std::cerr << "[FAIL] chunk_enumerator: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] chunk_enumerator\n";
  return 0;
}
