#include "linepump/codec.hpp"
#include "linepump/report_writer.hpp"
#include "linepump/run_json.hpp"
#include "linepump/strategy_runner.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string mode = "lines";           // lines|dual|single|preemptive|blocks|all
  std::string encoding = "utf-8";
  std::string delimiter;                // escaped text; empty -> platform newline
  std::size_t buffer_size = 64 * 1024;
  std::size_t segment_size = 4 * 1024;
  bool owned = false;
  bool count_only = false;
  bool digest = false;
  bool quiet = false;
  std::string run_json;
  std::string report;
  std::string url;
  std::string input;                    // path or "-"
  bool bad = false;
};

void usage(std::ostream& o) {
  o <<
    "Usage: linepump [--mode=lines|dual|single|preemptive|blocks|all]\n"
    "                [--encoding=utf-8|latin1] [--delimiter=TEXT] [--owned]\n"
    "                [--buffer-size=N] [--segment-size=N]\n"
    "                [--count] [--digest] [--quiet] [--run-json=PATH] [--report=PATH]\n"
    "                [--url=http://host:port/path | FILE | -]\n"
    "TEXT accepts \\n \\r \\t \\\\ escapes.\n";
}

// "\\r\\n" -> CR LF
bool unescape(const std::string& in, std::string& out) {
  out.clear();
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '\\') { out.push_back(in[i]); continue; }
    if (++i >= in.size()) return false;
    switch (in[i]) {
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case 't':  out.push_back('\t'); break;
      case '\\': out.push_back('\\'); break;
      default: return false;
    }
  }
  return true;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out) {
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out) {
      if (a.rfind(pfx, 0) != 0) return false;
      try {
        *out = std::stoull(a.substr(std::string(pfx).size()));
      } catch (const std::exception&) {
        std::cerr << "[linepump] bad number: " << a << "\n";
        c.bad = true;
      }
      return true;
    };
    std::string raw_delim;
    if (eat("--mode=", &c.mode)) continue;
    if (eat("--encoding=", &c.encoding)) continue;
    if (eat("--delimiter=", &raw_delim)) {
      if (!unescape(raw_delim, c.delimiter) || c.delimiter.empty()) {
        std::cerr << "[linepump] bad delimiter: " << raw_delim << "\n";
        c.bad = true;
      }
      continue;
    }
    if (eat_n("--buffer-size=", &c.buffer_size)) continue;
    if (eat_n("--segment-size=", &c.segment_size)) continue;
    if (eat("--run-json=", &c.run_json)) continue;
    if (eat("--report=", &c.report)) continue;
    if (eat("--url=", &c.url)) continue;
    if (a == "--owned")  { c.owned = true; continue; }
    if (a == "--count")  { c.count_only = true; continue; }
    if (a == "--digest") { c.digest = true; continue; }
    if (a == "--quiet")  { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a == "-" || a.rfind("--", 0) != 0) {
      if (!c.input.empty()) { std::cerr << "[linepump] more than one input: " << a << "\n"; c.bad = true; }
      c.input = a;
      continue;
    }
    std::cerr << "[linepump] unknown flag: " << a << "\n";
    c.bad = true;
  }
  if (!c.url.empty()) {
    if (!c.input.empty()) { std::cerr << "[linepump] give either --url or an input path\n"; c.bad = true; }
    c.input = c.url;
  }
  if (c.input.empty()) c.input = "-";
  return c;
}

void summarize(const lp::RunJsonPayload& p, bool quiet) {
  if (!p.ok) {
    std::cerr << "[linepump] " << p.strategy << " failed: " << p.error << "\n";
    return;
  }
  if (quiet) return;
  std::cerr << "[linepump] " << p.strategy
            << " units=" << p.stats.units
            << " bytes=" << p.stats.bytes
            << " wall_ms=" << p.stats.wall_ms
            << " mb_s=" << p.stats.throughput_mb_s;
  if (p.strategy == "lines")
    std::cerr << " starvations=" << p.starvations
              << " holdover_hw=" << p.holdover_high_water;
  std::cerr << "\n";
}

lp::CancellationSource g_cancel;

void on_sigint(int) { g_cancel.cancel(); }

}

int main(int argc, char** argv) {
  Cli cli = parse_cli(argc, argv);
  if (cli.bad) { usage(std::cerr); return 2; }
  if (!lp::codec_for(cli.encoding)) {
    std::cerr << "[linepump] unknown encoding: " << cli.encoding << "\n";
    return 2;
  }

  std::vector<lp::Strategy> strategies;
  if (cli.mode == "all") {
    if (cli.input == "-") { std::cerr << "[linepump] --mode=all needs a file or url\n"; return 2; }
    strategies = {lp::Strategy::Lines, lp::Strategy::Preemptive,
                  lp::Strategy::Dual, lp::Strategy::Single, lp::Strategy::Blocks};
  } else {
    lp::Strategy s = lp::Strategy::Lines;
    if (!lp::parse_strategy(cli.mode, s)) {
      std::cerr << "[linepump] unknown mode: " << cli.mode << "\n";
      return 2;
    }
    strategies.push_back(s);
  }

  std::signal(SIGINT, on_sigint);

  const bool print = !cli.count_only && !cli.digest && cli.mode != "all";
  std::vector<lp::RunJsonPayload> runs;
  bool all_ok = true;

  for (lp::Strategy s : strategies) {
    lp::RunOptions opt;
    opt.strategy = s;
    opt.input = cli.input;
    opt.buffer_size = cli.buffer_size;
    opt.segment_size = cli.segment_size;
    opt.encoding = cli.encoding;
    opt.delimiter = cli.delimiter;
    opt.owned_lines = cli.owned;
    opt.token = g_cancel.token();

    lp::UnitSink sink;
    if (print) {
      if (lp::is_line_strategy(s)) {
        sink = [](std::string_view line) {
          std::cout.write(line.data(), static_cast<std::streamsize>(line.size()));
          std::cout.put('\n');
          return static_cast<bool>(std::cout);
        };
      } else {
        sink = [](std::string_view block) {
          std::cout.write(block.data(), static_cast<std::streamsize>(block.size()));
          return static_cast<bool>(std::cout);
        };
      }
    }

    lp::RunJsonPayload p = lp::run_strategy(opt, sink);
    summarize(p, cli.quiet);
    if (cli.count_only) std::cout << p.strategy << " " << p.stats.units << " " << p.stats.bytes << "\n";
    if (cli.digest)     std::cout << p.strategy << " " << p.digest << "\n";
    all_ok &= p.ok;
    runs.push_back(std::move(p));
  }
  std::cout.flush();

  if (!cli.run_json.empty()) {
    std::string err;
    if (!lp::RunJsonWriter::write_file(runs.back(), cli.run_json, &err)) {
      std::cerr << "[linepump] run.json: " << err << "\n";
      return 1;
    }
  }
  if (!cli.report.empty()) {
    std::string err;
    if (!lp::write_report(cli.report, "linepump: " + cli.input, runs, &err)) {
      std::cerr << "[linepump] report: " << err << "\n";
      return 1;
    }
    if (!cli.quiet) std::cerr << "[linepump] report written: " << cli.report << "\n";
  }
  if (g_cancel.cancelled() && !cli.quiet) std::cerr << "[linepump] interrupted\n";
  return all_ok ? 0 : 1;
}
