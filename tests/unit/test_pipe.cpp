#include "linepump/feeds.hpp"
#include "linepump/line_splitter.hpp"
#include "linepump/pipe.hpp"
#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

template <typename F>
static bool throws_logic(F&& f) {
  try { f(); } catch (const std::logic_error&) { return true; }
  return false;
}

static void segmented_read_and_starvation_repeat() {
  lp::BufferPool pool(4);
  lp::Pipe::Config cfg;
  cfg.segment_bytes = 4;
  cfg.pool = &pool;
  {
    lp::Pipe pipe(cfg);
    pipe.write("abcdefghij");

    auto r = pipe.read({}).get();
    check(r.buffer.size() == 10 && !r.completed, "segmented_read: size");
    check(r.buffer.segments().size() == 3, "segmented_read: three segments");
    check(r.buffer.find("de") == 3, "segmented_read: match across segments");

    // consumed 0, examined 0: the same bytes come back at once
    pipe.advance(0, 0);
    auto f = pipe.read({});
    check(f.wait_for(0ms) == std::future_status::ready, "starvation_repeat: ready");
    r = f.get();
    check(r.buffer.to_string() == "abcdefghij", "starvation_repeat: same bytes");

    pipe.advance(5, 10);
    auto pending = pipe.read({});
    check(pending.wait_for(0ms) == std::future_status::timeout, "examined all: waits for more");
    pipe.write("k");
    r = pending.get();
    check(r.buffer.to_string() == "fghijk", "examined all: new bytes appended");
    pipe.advance(6, 6);
    check(pipe.buffered() == 0, "fully consumed");

    pipe.complete_writer();
    r = pipe.read({}).get();
    check(r.completed && r.buffer.empty(), "writer completion seen");
    pipe.complete();
    check(pipe.reader_completed(), "reader completed");
    check(!pipe.write("late"), "write after reader completed is dropped");
  }
  check(pool.outstanding() == 0, "segments returned to pool");
}

static void contract_violations() {
  lp::Pipe pipe;
  check(throws_logic([&] { pipe.advance(0); }), "advance without read");
  pipe.write("xyz");
  pipe.read({}).get();
  check(throws_logic([&] { pipe.read({}); }), "second read while outstanding");
  check(throws_logic([&] { pipe.advance(2, 1); }), "consumed past examined");
  check(throws_logic([&] { pipe.advance(0, 4); }), "examined past end");
  pipe.advance(3);
  pipe.complete();
  check(throws_logic([&] { pipe.read({}); }), "read after complete");
  pipe.complete();
}

static void writer_failure_and_cancel() {
  lp::Pipe failing;
  auto f = failing.read({});
  failing.fail_writer("upstream closed");
  try {
    f.get();
    check(false, "fail_writer: expected SourceError");
  } catch (const lp::SourceError& e) {
    check(std::string(e.what()) == "upstream closed", "fail_writer: message");
  }

  lp::Pipe idle;
  auto g = idle.read({});
  idle.cancel_pending_read();
  auto r = g.get();
  check(r.cancelled, "cancel_pending_read resolves cancelled");

  lp::CancellationSource cs;
  cs.cancel();
  lp::Pipe p3;
  check(p3.read(cs.token()).get().cancelled, "cancelled token resolves cancelled");

  lp::Pipe p4;
  auto h = p4.read({});
  p4.complete();
  check(h.get().completed, "reader complete resolves a pending read");
}

static void writer_pauses_on_backpressure() {
  lp::Pipe::Config cfg;
  cfg.segment_bytes = 4;
  cfg.pause_writer_bytes = 8;
  lp::Pipe pipe(cfg);

  const std::string payload(100, 'z');
  auto writer = std::async(std::launch::async, [&] {
    pipe.write(payload);
    pipe.complete_writer();
  });

  std::this_thread::sleep_for(50ms);
  check(pipe.bytes_written() < payload.size(), "backpressure: writer paused");

  std::size_t got = 0;
  for (;;) {
    auto r = pipe.read({}).get();
    got += r.buffer.size();
    pipe.advance(r.buffer.size());
    if (r.completed) break;
  }
  pipe.complete();
  writer.get();
  check(got == payload.size(), "backpressure: all bytes delivered");
}

static void splitter_over_threaded_pipe() {
  std::ostringstream text;
  for (int i = 0; i < 2000; ++i) text << "row " << i << (i % 7 ? ",value" : "") << "\n";
  const std::string data = text.str();

  lp::Pipe::Config cfg;
  cfg.segment_bytes = 16;
  cfg.pause_writer_bytes = 64;
  lp::Pipe pipe(cfg);
  auto writer = std::async(std::launch::async, [&] {
    std::size_t step = 1;
    for (std::size_t at = 0; at < data.size(); at += step, step = step % 13 + 1) {
      if (!pipe.write(std::string_view(data).substr(at, step))) return;
    }
    pipe.complete_writer();
  });

  lp::LineSplitter::Config sc;
  sc.delimiter = "\n";
  lp::LineSplitter sp(pipe, sc);
  std::istringstream ref(data);
  std::string want;
  std::string_view line;
  std::size_t n = 0;
  bool same = true;
  while (sp.next(line)) {
    if (!std::getline(ref, want) || want != line) { same = false; break; }
    ++n;
  }
  sp.close();
  writer.get();
  check(same && n == 2000, "splitter_over_threaded_pipe: lines=" + std::to_string(n));
  check(!sp.failed(), "splitter_over_threaded_pipe: " + sp.error());
}

static void cancel_wakes_reader_on_idle_pipe() {
  lp::Pipe pipe;
  lp::CancellationSource cs;
  lp::LineSplitter::Config sc;
  sc.delimiter = "\n";
  lp::LineSplitter sp(pipe, sc, cs.token());
  lp::CancelWatch watch(pipe, cs.token(), 5ms);

  // nothing is ever written; only the watch can end the pending read
  auto canceller = std::async(std::launch::async, [&] {
    std::this_thread::sleep_for(30ms);
    cs.cancel();
  });
  std::string_view line;
  check(!sp.next(line), "cancel_wakes_reader: no line");
  check(sp.cancelled() && !sp.failed(), "cancel_wakes_reader: ended cancelled");
  check(watch.wakeups() == 1, "cancel_wakes_reader: one wakeup");
  canceller.get();
  check(pipe.reader_completed(), "cancel_wakes_reader: pipe completed");
}

static void stdin_feed_stops_on_cancel() {
  int fds[2];
  if (::pipe(fds) != 0) { check(false, "stdin_feed_stops_on_cancel: pipe(2)"); return; }
  std::FILE* in = ::fdopen(fds[0], "rb");
  if (!in) { check(false, "stdin_feed_stops_on_cancel: fdopen"); return; }

  lp::Pipe pipe;
  lp::CancellationSource cs;
  lp::FileFeedConfig fc;
  fc.token = cs.token();
  fc.poll_ms = 5;
  auto producer = lp::feed_stdio(in, pipe, fc);

  const char part[] = "partial";
  check(::write(fds[1], part, sizeof(part) - 1) == static_cast<ssize_t>(sizeof(part) - 1),
        "stdin_feed_stops_on_cancel: write");
  auto r = pipe.read({}).get();
  check(r.buffer.to_string() == "partial", "stdin_feed_stops_on_cancel: bytes forwarded");
  pipe.advance(0, r.buffer.size());

  // the write end stays open, so only cancellation ends the producer
  cs.cancel();
  check(producer.wait_for(2s) == std::future_status::ready, "stdin_feed_stops_on_cancel: producer ended");
  r = pipe.read({}).get();
  check(r.completed, "stdin_feed_stops_on_cancel: writer completed");
  pipe.complete();
  std::fclose(in);
  ::close(fds[1]);
}

int main() {
  segmented_read_and_starvation_repeat();
  contract_violations();
  writer_failure_and_cancel();
  writer_pauses_on_backpressure();
  splitter_over_threaded_pipe();
  cancel_wakes_reader_on_idle_pipe();
  stdin_feed_stops_on_cancel();

  if (failures) { std::cerr << "[FAIL] pipe: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] pipe\n";
  return 0;
}
