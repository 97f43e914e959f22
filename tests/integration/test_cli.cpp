#include <simdjson.h>
#include <sys/wait.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static int run(const std::string& cmd) {
  int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream o;
  o << in.rdbuf();
  return o.str();
}

int main(int argc, char** argv) {
  const std::string bin = argc > 1 ? argv[1] : env_or("LP_BIN", "build/linepump");
  const fs::path input = "tests/data/sample.csv";
  if (!fs::exists(input)) { std::cerr << "[ERR] missing: " << input << "\n"; return 2; }
  if (!fs::exists(bin))   { std::cerr << "[ERR] missing binary: " << bin << "\n"; return 2; }

  const fs::path tmp = fs::temp_directory_path() / ("lp-cli-" + std::to_string(std::time(nullptr)));
  fs::create_directories(tmp);
  const fs::path runjson = tmp / "run.json";
  const fs::path out = tmp / "out.txt";

  // plain run prints the lines back
  int rc = run("\"" + bin + "\" --quiet \"" + input.string() + "\" > \"" + out.string() + "\"");
  check(rc == 0, "plain run rc=" + std::to_string(rc));
  check(slurp(out) == slurp(input), "plain run echoes the input lines");

  rc = run("\"" + bin + "\" --digest --quiet --run-json=\"" + runjson.string() + "\" \"" +
           input.string() + "\" > \"" + out.string() + "\"");
  check(rc == 0, "digest run rc=" + std::to_string(rc));

  simdjson::dom::parser p;
  simdjson::dom::element doc;
  if (p.load(runjson.string()).get(doc)) {
    check(false, "run.json missing or invalid");
  } else {
    std::string_view strategy, digest;
    uint64_t units = 0;
    bool ok = false;
    check(!doc["strategy"].get_string().get(strategy) && strategy == "lines", "run.json strategy");
    check(!doc["units"].get_uint64().get(units) && units == 8, "run.json units=" + std::to_string(units));
    check(!doc["ok"].get_bool().get(ok) && ok, "run.json ok");
    check(!doc["digest"].get_string().get(digest) && digest.size() == 64, "run.json digest");
    check(slurp(out) == "lines " + std::string(digest) + "\n", "stdout digest matches run.json");
  }

  // raw blocks echo the input bytes
  rc = run("\"" + bin + "\" --mode=blocks --quiet \"" + input.string() + "\" > \"" + out.string() + "\"");
  check(rc == 0 && slurp(out) == slurp(input), "blocks mode echoes the input bytes");

  // stdin
  rc = run("\"" + bin + "\" --count --quiet - < \"" + input.string() + "\" > \"" + out.string() + "\"");
  check(rc == 0 && slurp(out).rfind("lines 8 ", 0) == 0, "stdin count: " + slurp(out));

  // all strategies plus a report
  const fs::path report = tmp / "report.html";
  rc = run("\"" + bin + "\" --mode=all --count --quiet --report=\"" + report.string() + "\" \"" +
           input.string() + "\" > \"" + out.string() + "\"");
  check(rc == 0, "all modes rc=" + std::to_string(rc));
  const std::string html = slurp(report);
  check(html.find("All digests agree.") != std::string::npos, "report digests agree");
  const std::string counts = slurp(out);
  for (const char* s : {"lines 8", "preemptive 8", "dual ", "single ", "blocks "})
    check(counts.find(s) != std::string::npos, std::string("count line for ") + s);

  // usage and input errors
  check(run("\"" + bin + "\" --bogus 2>/dev/null") == 2, "unknown flag exits 2");
  check(run("\"" + bin + "\" --mode=turbo x 2>/dev/null") == 2, "unknown mode exits 2");
  check(run("\"" + bin + "\" --quiet tests/data/nope.txt 2>/dev/null") == 1, "missing input exits 1");

  std::error_code ec;
  fs::remove_all(tmp, ec);

  if (failures) { std::cerr << "[FAIL] cli: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] cli\n";
  return 0;
}
