#include "linepump/line_digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lp {

struct LineDigest::Impl {
  EVP_MD_CTX* ctx{nullptr};

  Impl() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    restart();
  }
  ~Impl() { EVP_MD_CTX_free(ctx); }

  void restart() {
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1)
      throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  void update(const void* data, std::size_t n) {
    if (n && EVP_DigestUpdate(ctx, data, n) != 1)
      throw std::runtime_error("EVP_DigestUpdate failed");
  }
};

LineDigest::LineDigest() : p_(new Impl) {}
LineDigest::~LineDigest() { delete p_; }

void LineDigest::add_line(std::string_view line) {
  p_->update(line.data(), line.size());
  p_->update("\n", 1);
  ++lines_;
}

void LineDigest::add_bytes(std::string_view bytes) { p_->update(bytes.data(), bytes.size()); }

std::string LineDigest::hex() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(p_->ctx, md, &len) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  p_->restart();
  lines_ = 0;

  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  return o.str();
}

std::string sha256_hex(std::string_view data) {
  LineDigest d;
  d.add_bytes(data);
  return d.hex();
}

}
