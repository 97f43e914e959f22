#pragma once
#include "linepump/run_json.hpp"
#include <string>
#include <vector>

namespace lp {

// HTML table comparing several runs over the same input.
std::string render_report(const std::string& title,
                          const std::vector<RunJsonPayload>& runs,
                          std::string* err = nullptr);

bool write_report(const std::string& path,
                  const std::string& title,
                  const std::vector<RunJsonPayload>& runs,
                  std::string* err = nullptr);

}
