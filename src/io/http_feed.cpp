#include "linepump/feeds.hpp"
#include "linepump/pipe.hpp"
#include <httplib.h>
#include <string_view>

namespace lp {

bool split_url(const std::string& url, HttpConfig& out) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;
  const std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") return false;
  const auto path_start = url.find('/', scheme_end + 3);
  if (path_start == std::string::npos) {
    out.base_url = url;
    out.path = "/";
  } else {
    out.base_url = url.substr(0, path_start);
    out.path = url.substr(path_start);
  }
  return out.base_url.size() > scheme_end + 3;
}

std::future<void> feed_http(HttpConfig cfg, Pipe& pipe) {
  return std::async(std::launch::async, [cfg, &pipe]() {
    httplib::Client cli(cfg.base_url);
    cli.set_connection_timeout(cfg.connect_timeout_sec, 0);
    cli.set_read_timeout(cfg.read_timeout_sec, 0);

    int status = 0;
    bool reader_gone = false;
    auto res = cli.Get(
        cfg.path,
        [&](const httplib::Response& r) {
          status = r.status;
          return r.status == 200;
        },
        [&](const char* data, size_t len) {
          // each network fragment goes straight into the pipe
          if (!pipe.write(std::string_view(data, len))) { reader_gone = true; return false; }
          return true;
        });

    if (reader_gone) return;
    if (status != 0 && status != 200) {
      pipe.fail_writer("HTTP " + std::to_string(status) + " for " + cfg.base_url + cfg.path);
      return;
    }
    if (!res) {
      pipe.fail_writer("HTTP request failed: " + httplib::to_string(res.error()));
      return;
    }
    pipe.complete_writer();
  });
}

}
