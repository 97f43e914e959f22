#include "linepump/strategy_runner.hpp"
#include "linepump/chunk_enumerator.hpp"
#include "linepump/codec.hpp"
#include "linepump/double_buffer_pump.hpp"
#include "linepump/feeds.hpp"
#include "linepump/line_digest.hpp"
#include "linepump/line_splitter.hpp"
#include "linepump/metrics.hpp"
#include "linepump/pipe.hpp"
#include "linepump/preemptive_line_reader.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

namespace lp {

namespace {

using clk = std::chrono::steady_clock;

bool is_url(const std::string& s) {
  return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

struct FileCloser {
  void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// Starts the producer for a file, stdin or URL input.
std::future<void> start_feed(const RunOptions& opt, const HttpConfig& h, Pipe& pipe) {
  FileFeedConfig fcfg;
  fcfg.block_bytes = opt.buffer_size;
  fcfg.token = opt.token;
  if (is_url(opt.input)) return feed_http(h, pipe);
  if (opt.input == "-") return feed_stdio(stdin, pipe, fcfg);
  return feed_file(opt.input, pipe, fcfg);
}

bool parse_input(const RunOptions& opt, HttpConfig& h, RunJsonPayload& p) {
  if (is_url(opt.input) && !split_url(opt.input, h)) {
    p.ok = false;
    p.error = "bad url: " + opt.input;
    return false;
  }
  return true;
}

void run_lines(const RunOptions& opt, const Codec& codec, const UnitSink& sink,
               MetricsRegistry& m, LineDigest& dig, RunJsonPayload& p) {
  HttpConfig h;
  if (!parse_input(opt, h, p)) return;

  LineSplitter::Config cfg;
  cfg.codec = &codec;
  if (!opt.delimiter.empty()) cfg.delimiter = codec.encode(opt.delimiter);
  cfg.owned_lines = opt.owned_lines;

  Pipe::Config pcfg;
  pcfg.segment_bytes = opt.segment_size;
  Pipe pipe(pcfg);
  // destroyed in reverse: the splitter completes the pipe, which releases a
  // paused producer, then the future waits for it before the pipe goes away
  std::future<void> producer;
  LineSplitter splitter(pipe, cfg, opt.token);

  producer = start_feed(opt, h, pipe);

  // goes first on the way out, before the splitter and the pipe
  CancelWatch watch(pipe, opt.token);

  m.start_stage("split");
  splitter.for_each_line([&](std::string_view line) {
    m.add_unit(line.size());
    dig.add_line(line);
    return sink ? sink(line) : true;
  });
  m.end_stage("split");
  splitter.close();
  producer.wait();

  p.starvations = splitter.starvations();
  p.holdover_high_water = splitter.holdover_high_water();
  if (splitter.failed()) { p.ok = false; p.error = splitter.error(); }
}

void run_blocks(const RunOptions& opt, const UnitSink& sink,
                MetricsRegistry& m, LineDigest& dig, RunJsonPayload& p) {
  HttpConfig h;
  if (!parse_input(opt, h, p)) return;

  Pipe::Config pcfg;
  pcfg.segment_bytes = opt.segment_size;
  Pipe pipe(pcfg);
  std::future<void> producer;
  ChunkEnumerator blocks(pipe, ChunkEnumerator::Config{}, opt.token);
  producer = start_feed(opt, h, pipe);
  CancelWatch watch(pipe, opt.token);

  m.start_stage("blocks");
  blocks.for_each_block([&](const ByteSequence& b) {
    m.add_unit(b.size());
    for (std::string_view seg : b.segments()) dig.add_bytes(seg);
    if (!sink) return true;
    for (std::string_view seg : b.segments()) {
      if (!sink(seg)) return false;
    }
    return true;
  });
  m.end_stage("blocks");
  blocks.close();
  producer.wait();
  if (blocks.failed()) { p.ok = false; p.error = blocks.error(); }
}

template <typename Pump>
void run_pump(const RunOptions& opt, const UnitSink& sink,
              MetricsRegistry& m, LineDigest& dig, RunJsonPayload& p) {
  if (is_url(opt.input)) { p.ok = false; p.error = "buffer pumps read files or stdin"; return; }

  FilePtr owned;
  std::FILE* f = stdin;
  if (opt.input != "-") {
    owned.reset(std::fopen(opt.input.c_str(), "rb"));
    if (!owned) {
      p.ok = false;
      p.error = "open failed: " + opt.input + ": " + std::strerror(errno);
      return;
    }
    f = owned.get();
  }

  Pump pump(file_fill(f), opt.buffer_size, opt.token);
  m.start_stage("pump");
  BufferView<char> v;
  while (pump.next(v)) {
    std::string_view block(v.data, v.size);
    m.add_unit(block.size());
    dig.add_bytes(block);
    if (sink && !sink(block)) break;
  }
  m.end_stage("pump");
  if (pump.failed()) { p.ok = false; p.error = pump.error(); }
}

void run_preemptive(const RunOptions& opt, const Codec& codec, const UnitSink& sink,
                    MetricsRegistry& m, LineDigest& dig, RunJsonPayload& p) {
  if (is_url(opt.input)) { p.ok = false; p.error = "preemptive reader reads files or stdin"; return; }

  IstreamLineSource::Config lcfg;
  const std::string delim = opt.delimiter.empty() ? std::string(platform_newline()) : opt.delimiter;
  if (delim.size() > 1 && delim != "\r\n") {
    p.ok = false;
    p.error = "preemptive reader needs a one-byte delimiter or \\r\\n";
    return;
  }
  lcfg.delimiter = delim.back();
  lcfg.strip_cr = (delim == "\r\n");

  std::ifstream file;
  std::istream* in = &std::cin;
  if (opt.input != "-") {
    file.open(opt.input, std::ios::binary);
    if (!file) { p.ok = false; p.error = "open failed: " + opt.input; return; }
    in = &file;
  }

  IstreamLineSource src(*in, lcfg);
  PreemptiveLineReader reader(src, opt.token);
  std::string raw, text;
  m.start_stage("read_lines");
  while (reader.next(raw)) {
    try {
      text.resize(codec.char_length(raw));
      if (!text.empty()) codec.decode(raw, &text[0]);
    } catch (const DecodeError& e) {
      p.ok = false;
      p.error = e.what();
      break;
    }
    m.add_unit(text.size());
    dig.add_line(text);
    if (sink && !sink(text)) break;
  }
  m.end_stage("read_lines");
  if (reader.failed()) { p.ok = false; p.error = reader.error(); }
}

}

bool parse_strategy(std::string_view s, Strategy& out) {
  if (s == "lines")      { out = Strategy::Lines; return true; }
  if (s == "dual")       { out = Strategy::Dual; return true; }
  if (s == "single")     { out = Strategy::Single; return true; }
  if (s == "preemptive") { out = Strategy::Preemptive; return true; }
  if (s == "blocks")     { out = Strategy::Blocks; return true; }
  return false;
}

const char* to_string(Strategy s) noexcept {
  switch (s) {
    case Strategy::Lines:      return "lines";
    case Strategy::Dual:       return "dual";
    case Strategy::Single:     return "single";
    case Strategy::Preemptive: return "preemptive";
    case Strategy::Blocks:     return "blocks";
  }
  return "unknown";
}

bool is_line_strategy(Strategy s) noexcept {
  return s == Strategy::Lines || s == Strategy::Preemptive;
}

RunJsonPayload run_strategy(const RunOptions& opt, const UnitSink& sink) {
  RunJsonPayload p;
  p.strategy = to_string(opt.strategy);
  p.input = opt.input;
  p.encoding = opt.encoding;
  p.buffer_size = opt.buffer_size;

  const Codec* codec = codec_for(opt.encoding);
  if (!codec) {
    p.ok = false;
    p.error = "unknown encoding: " + opt.encoding;
    return p;
  }
  if (opt.buffer_size == 0) {
    p.ok = false;
    p.error = "buffer size must be > 0";
    return p;
  }

  MetricsRegistry m;
  const auto t0 = clk::now();
  try {
    LineDigest dig;
    switch (opt.strategy) {
      case Strategy::Lines:      run_lines(opt, *codec, sink, m, dig, p); break;
      case Strategy::Dual:       run_pump<DoubleBufferPump<char>>(opt, sink, m, dig, p); break;
      case Strategy::Single:     run_pump<SingleBufferPump<char>>(opt, sink, m, dig, p); break;
      case Strategy::Preemptive: run_preemptive(opt, *codec, sink, m, dig, p); break;
      case Strategy::Blocks:     run_blocks(opt, sink, m, dig, p); break;
    }
    p.digest = dig.hex();
  } catch (const std::exception& e) {
    // codec.encode of the delimiter, digest backend, thread start
    p.ok = false;
    p.error = e.what();
  }
  const double wall_ms = std::chrono::duration<double, std::milli>(clk::now() - t0).count();
  p.stats = m.snapshot(wall_ms);
  return p;
}

}
