#include "linepump/report_writer.hpp"
#include <kainjow/mustache.hpp>
#include <cstdio>
#include <fstream>

namespace lp {

namespace {

const char* kReportTemplate = R"(<!doctype html>
<html><head><meta charset="utf-8"><title>{{title}}</title>
<style>
body{font-family:sans-serif;margin:2em}
table{border-collapse:collapse}
td,th{border:1px solid #ccc;padding:4px 10px;text-align:right}
td.l,th.l{text-align:left}
.bad{color:#b00}
</style></head>
<body>
<h1>{{title}}</h1>
<table>
<tr><th class="l">strategy</th><th class="l">input</th><th>buffer</th><th>units</th><th>bytes</th>
<th>wall ms</th><th>MB/s</th><th>units/s</th><th>starvations</th><th class="l">digest</th></tr>
{{#runs}}
<tr><td class="l">{{strategy}}</td><td class="l">{{input}}</td><td>{{buffer_size}}</td><td>{{units}}</td><td>{{bytes}}</td>
<td>{{wall_ms}}</td><td>{{mb_s}}</td><td>{{units_s}}</td><td>{{starvations}}</td>
<td class="l">{{digest}}{{^ok}} <span class="bad">{{error}}</span>{{/ok}}</td></tr>
{{/runs}}
</table>
{{#same_digest}}<p>All digests agree.</p>{{/same_digest}}
{{^same_digest}}<p class="bad">Digests differ between runs.</p>{{/same_digest}}
</body></html>
)";

std::string fmt2(double v) {
  char tmp[64];
  int n = std::snprintf(tmp, sizeof(tmp), "%.2f", v);
  return std::string(tmp, n > 0 ? static_cast<size_t>(n) : 0);
}

}

std::string render_report(const std::string& title,
                          const std::vector<RunJsonPayload>& runs,
                          std::string* err) {
  using kainjow::mustache::data;
  kainjow::mustache::mustache view(kReportTemplate);
  if (!view.is_valid()) {
    if (err) *err = view.error_message();
    return {};
  }

  data rows{data::type::list};
  // line strategies digest lines, pumps digest raw blocks; compare within each group
  bool same = !runs.empty();
  std::string line_digest, block_digest;
  for (const auto& r : runs) {
    data row;
    row.set("strategy", r.strategy);
    row.set("input", r.input);
    row.set("buffer_size", std::to_string(r.buffer_size));
    row.set("units", std::to_string(r.stats.units));
    row.set("bytes", std::to_string(r.stats.bytes));
    row.set("wall_ms", fmt2(r.stats.wall_ms));
    row.set("mb_s", fmt2(r.stats.throughput_mb_s));
    row.set("units_s", fmt2(r.stats.units_per_sec));
    row.set("starvations", std::to_string(r.starvations));
    row.set("digest", r.digest);
    row.set("ok", data(r.ok));
    row.set("error", r.error);
    rows.push_back(row);
    std::string& ref = (r.strategy == "lines" || r.strategy == "preemptive") ? line_digest : block_digest;
    if (!r.ok) same = false;
    else if (ref.empty()) ref = r.digest;
    else if (ref != r.digest) same = false;
  }

  data ctx;
  ctx.set("title", title);
  ctx.set("runs", rows);
  ctx.set("same_digest", data(same));

  std::string html = view.render(ctx);
  if (!view.is_valid()) {
    if (err) *err = view.error_message();
    return {};
  }
  return html;
}

bool write_report(const std::string& path,
                  const std::string& title,
                  const std::vector<RunJsonPayload>& runs,
                  std::string* err) {
  std::string html = render_report(title, runs, err);
  if (html.empty()) return false;
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err) *err = "write failed: " + path;
    return false;
  }
  out.write(html.data(), static_cast<std::streamsize>(html.size()));
  return static_cast<bool>(out);
}

}
