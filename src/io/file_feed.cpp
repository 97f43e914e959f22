#include "linepump/feeds.hpp"
#include "linepump/pipe.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

namespace lp {

static void copy_stdio(std::FILE* f, Pipe& pipe, std::size_t block_bytes) {
  std::vector<char> buf(block_bytes ? block_bytes : 1);
  while (true) {
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0 && std::ferror(f)) {
      pipe.fail_writer(std::string("fread failed: ") + std::strerror(errno));
      return;
    }
    if (n == 0 && std::feof(f)) break;
    if (!pipe.write(std::string_view(buf.data(), n))) return; // reader went away
  }
  pipe.complete_writer();
}

std::future<void> feed_file(const std::string& path, Pipe& pipe, FileFeedConfig cfg) {
  return std::async(std::launch::async, [path, &pipe, cfg]() {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
      pipe.fail_writer("open failed: " + path + ": " + std::strerror(errno));
      return;
    }
    copy_stdio(f, pipe, cfg.block_bytes);
    std::fclose(f);
  });
}

// Reads the descriptor behind `f` directly: fread would block until a whole
// block arrives, and an idle terminal or pipe would never notice cancellation.
static void copy_fd(int fd, Pipe& pipe, const FileFeedConfig& cfg) {
  std::vector<char> buf(cfg.block_bytes ? cfg.block_bytes : 1);
  while (true) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, cfg.poll_ms);
    if (cfg.token.cancelled()) break;
    if (ready < 0) {
      if (errno == EINTR) continue;
      pipe.fail_writer(std::string("poll failed: ") + std::strerror(errno));
      return;
    }
    if (ready == 0) continue;

    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      pipe.fail_writer(std::string("read failed: ") + std::strerror(errno));
      return;
    }
    if (n == 0) break;
    if (!pipe.write(std::string_view(buf.data(), static_cast<std::size_t>(n)))) return;
  }
  pipe.complete_writer();
}

std::future<void> feed_stdio(std::FILE* f, Pipe& pipe, FileFeedConfig cfg) {
  return std::async(std::launch::async, [f, &pipe, cfg]() {
    const int fd = ::fileno(f);
    if (fd < 0) copy_stdio(f, pipe, cfg.block_bytes);
    else copy_fd(fd, pipe, cfg);
  });
}

}
