#include "linepump/double_buffer_pump.hpp"
#include "linepump/chunk_source.hpp"
#include <cerrno>
#include <cstring>

namespace lp {

FillFn<char> file_fill(std::FILE* f) {
  return [f](char* dest, std::size_t cap) {
    return std::async(std::launch::async, [f, dest, cap]() -> std::size_t {
      const std::size_t n = std::fread(dest, 1, cap, f);
      if (n == 0 && std::ferror(f)) {
        const int e = errno;
        throw SourceError(std::string("fread failed: ") + std::strerror(e));
      }
      return n;
    });
  };
}

FillFn<char> stream_fill(std::istream& in) {
  return [&in](char* dest, std::size_t cap) {
    return std::async(std::launch::async, [&in, dest, cap]() -> std::size_t {
      in.read(dest, static_cast<std::streamsize>(cap));
      if (in.bad()) throw SourceError("stream read failed");
      return static_cast<std::size_t>(in.gcount());
    });
  };
}

}
