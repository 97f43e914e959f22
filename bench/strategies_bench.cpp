#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "linepump/report_writer.hpp"
#include "linepump/strategy_runner.hpp"

namespace fs = std::filesystem;

static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "lp_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ","; }
  out << "\n";
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;              // if empty -> synth
  std::size_t rows = 200'000;
  std::size_t cols = 8;
  std::size_t buffer = 1024;
  int iters = 3;
  std::string report;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--file") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--buffer") a.buffer = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--report") a.report = val;
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: lp_bench_strategies [--file=path] [--rows=N] [--cols=M] [--buffer=B] [--iters=K] [--report=out.html]\n"
        "If --file is omitted, a synthetic CSV is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

int main(int argc, char** argv) {
  Args a = parse_args(argc, argv);
  const std::string path = a.path.empty() ? make_synth_csv(a.rows, a.cols) : a.path;
  std::cout << "[bench] file=" << path << " buffer=" << a.buffer << " iters=" << a.iters << "\n";

  const lp::Strategy order[] = {lp::Strategy::Single, lp::Strategy::Dual,
                                lp::Strategy::Blocks, lp::Strategy::Preemptive,
                                lp::Strategy::Lines};
  std::vector<lp::RunJsonPayload> last;
  std::string line_digest;
  int rc = 0;

  for (lp::Strategy s : order) {
    lp::RunJsonPayload best;
    for (int k = 1; k <= a.iters; ++k) {
      lp::RunOptions opt;
      opt.strategy = s;
      opt.input = path;
      opt.buffer_size = a.buffer;
      lp::RunJsonPayload p = lp::run_strategy(opt);
      if (!p.ok) {
        std::cerr << "[bench] " << p.strategy << " failed: " << p.error << "\n";
        rc = 1;
        break;
      }
      std::cout << "  " << p.strategy << " iter " << k
                << ": units=" << p.stats.units
                << " time=" << p.stats.wall_ms << "ms"
                << " rate=" << p.stats.throughput_mb_s << " MiB/s\n";
      if (k == 1 || p.stats.wall_ms < best.stats.wall_ms) best = p;
    }
    if (lp::is_line_strategy(s)) {
      if (line_digest.empty()) line_digest = best.digest;
      else if (best.digest != line_digest) {
        std::cerr << "[bench] digest mismatch between line strategies\n";
        rc = 1;
      }
    }
    last.push_back(best);
  }

  if (!a.report.empty()) {
    std::string err;
    if (!lp::write_report(a.report, "linepump bench: " + path, last, &err)) {
      std::cerr << "[bench] report failed: " << err << "\n";
      rc = 1;
    } else {
      std::cout << "[bench] report: " << a.report << "\n";
    }
  }
  return rc;
}
