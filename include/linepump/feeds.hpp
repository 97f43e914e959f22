#pragma once
#include "linepump/cancellation.hpp"
#include <cstddef>
#include <cstdio>
#include <future>
#include <string>

namespace lp {

class Pipe;

struct FileFeedConfig {
  std::size_t block_bytes = 64 * 1024;
  // feed_stdio only: stop waiting for input once cancelled
  CancellationToken token;
  int poll_ms = 50;
};

struct HttpConfig {
  std::string base_url;          // "http://host:port"
  std::string path = "/";
  int connect_timeout_sec = 5;
  int read_timeout_sec = 30;
};

// Producers: copy a transport into `pipe` on a background task, then complete
// the writer, or fail it with a message. The future resolves once the
// producer has stopped (end of input, error, or reader completed early).
std::future<void> feed_file(const std::string& path, Pipe& pipe, FileFeedConfig cfg = {});
std::future<void> feed_stdio(std::FILE* f, Pipe& pipe, FileFeedConfig cfg = {});
std::future<void> feed_http(HttpConfig cfg, Pipe& pipe);

// Splits "http://host:port/path?q" into base url and path; false if not http(s).
bool split_url(const std::string& url, HttpConfig& out);

}
