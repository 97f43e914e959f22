#include "linepump/buffer_pool.hpp"
#include <algorithm>
#include <new>

namespace lp {

PooledBuffer::PooledBuffer(PooledBuffer&& o) noexcept
  : pool_(o.pool_), block_(std::move(o.block_)), capacity_(o.capacity_) {
  o.pool_ = nullptr;
  o.capacity_ = 0;
}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& o) noexcept {
  if (this != &o) {
    release();
    pool_ = o.pool_;
    block_ = std::move(o.block_);
    capacity_ = o.capacity_;
    o.pool_ = nullptr;
    o.capacity_ = 0;
  }
  return *this;
}

PooledBuffer::~PooledBuffer() { release(); }

void PooledBuffer::release() noexcept {
  if (!block_) return;
  if (pool_) pool_->give_back(std::move(block_), capacity_);
  block_.reset();
  pool_ = nullptr;
  capacity_ = 0;
}

BufferPool::BufferPool(std::size_t min_block) : min_block_(std::max<std::size_t>(min_block, 1)) {}

PooledBuffer BufferPool::rent(std::size_t min_size) {
  std::lock_guard<std::mutex> lk(mu_);
  ++rented_;
  ++outstanding_;
  high_water_ = std::max(high_water_, outstanding_);

  // smallest free block that fits
  auto best = free_.end();
  for (auto it = free_.begin(); it != free_.end(); ++it) {
    if (it->capacity < min_size) continue;
    if (best == free_.end() || it->capacity < best->capacity) best = it;
  }
  if (best != free_.end()) {
    FreeBlock fb = std::move(*best);
    free_.erase(best);
    return PooledBuffer(this, std::move(fb.block), fb.capacity);
  }

  const std::size_t cap = std::max(min_size, min_block_);
  std::unique_ptr<char[]> block;
  try {
    block.reset(new char[cap]);
  } catch (const std::bad_alloc&) {
    --outstanding_;
    throw;
  }
  return PooledBuffer(this, std::move(block), cap);
}

void BufferPool::give_back(std::unique_ptr<char[]> block, std::size_t cap) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  if (outstanding_ > 0) --outstanding_;
  try {
    free_.push_back(FreeBlock{std::move(block), cap});
  } catch (const std::bad_alloc&) {
    // block is freed by its unique_ptr
  }
}

std::size_t BufferPool::outstanding() const {
  std::lock_guard<std::mutex> lk(mu_);
  return outstanding_;
}

std::uint64_t BufferPool::rented_total() const {
  std::lock_guard<std::mutex> lk(mu_);
  return rented_;
}

std::size_t BufferPool::high_water() const {
  std::lock_guard<std::mutex> lk(mu_);
  return high_water_;
}

std::size_t BufferPool::free_blocks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return free_.size();
}

BufferPool& BufferPool::shared() {
  static BufferPool pool(1024);
  return pool;
}

}
