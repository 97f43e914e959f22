#pragma once
#include "linepump/cancellation.hpp"
#include "linepump/run_json.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace lp {

enum class Strategy { Lines, Dual, Single, Preemptive, Blocks };

bool parse_strategy(std::string_view s, Strategy& out);
const char* to_string(Strategy s) noexcept;

struct RunOptions {
  Strategy strategy = Strategy::Lines;
  std::string input;                     // file path, "-" for stdin, or http:// URL
  std::size_t buffer_size = 64 * 1024;   // pump buffers / file feed blocks
  std::size_t segment_size = 4 * 1024;   // pipe segments
  std::string encoding = "utf-8";
  std::string delimiter;                 // text; empty -> platform newline
  bool owned_lines = false;
  CancellationToken token;
};

// Receives lines (line strategies) or raw blocks (pump strategies).
// Returning false stops the run early.
using UnitSink = std::function<bool(std::string_view)>;

// Runs one strategy end to end and reports what happened. Never throws for
// input or transport problems; those land in `ok`/`error`.
RunJsonPayload run_strategy(const RunOptions& opt, const UnitSink& sink = {});

bool is_line_strategy(Strategy s) noexcept;

}
