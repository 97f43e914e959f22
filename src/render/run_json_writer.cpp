#include "linepump/run_json.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace lp {

static void esc(std::ostringstream& o, const std::string& s) {
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v) { return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"strategy\":"; esc(o, p.strategy); o << ",";
  o << "\"input\":";    esc(o, p.input);    o << ",";
  o << "\"encoding\":"; esc(o, p.encoding); o << ",";
  o << "\"buffer_size\":" << p.buffer_size << ",";
  o << "\"units\":" << p.stats.units << ",";
  o << "\"bytes\":" << p.stats.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.stats.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.stats.throughput_mb_s) << ",";
  o << "\"units_per_sec\":" << safe_num(p.stats.units_per_sec) << ",";
  o << "\"starvations\":" << p.starvations << ",";
  o << "\"holdover_high_water\":" << p.holdover_high_water << ",";

  o << "\"stage_times\":[";
  for (size_t i = 0; i < p.stats.stages.size(); ++i) {
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stats.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(p.stats.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"digest\":"; esc(o, p.digest); o << ",";
  o << "\"ok\":" << (p.ok ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, p.error);
  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const RunJsonPayload& p, const std::string& path, std::string* err) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err) *err = "failed to open " + path;
    return false;
  }
  const std::string js = to_json(p);
  out.write(js.data(), static_cast<std::streamsize>(js.size()));
  if (!out) {
    if (err) *err = "failed to write " + path;
    return false;
  }
  return true;
}

}
