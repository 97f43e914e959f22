#pragma once
#include "linepump/metrics.hpp"
#include <cstdint>
#include <string>

namespace lp {

struct RunJsonPayload {
  std::string strategy;      // lines | dual | single | preemptive
  std::string input;
  std::string encoding;
  std::uint64_t buffer_size = 0;

  RunStats stats;

  // line strategies only
  std::uint64_t starvations = 0;
  std::uint64_t holdover_high_water = 0;

  std::string digest;        // sha-256 over emitted data, hex
  bool ok = true;
  std::string error;
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
  static bool write_file(const RunJsonPayload& p, const std::string& path, std::string* err = nullptr);
};

}
