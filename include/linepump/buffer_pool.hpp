#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace lp {

class BufferPool;

// Move-only rental of one pooled block. Returns the block on destruction.
class PooledBuffer {
public:
  PooledBuffer() = default;
  PooledBuffer(PooledBuffer&& o) noexcept;
  PooledBuffer& operator=(PooledBuffer&& o) noexcept;
  PooledBuffer(const PooledBuffer&) = delete;
  PooledBuffer& operator=(const PooledBuffer&) = delete;
  ~PooledBuffer();

  char* data() noexcept { return block_.get(); }
  const char* data() const noexcept { return block_.get(); }
  std::size_t capacity() const noexcept { return capacity_; }
  explicit operator bool() const noexcept { return block_ != nullptr; }

  // Give the block back early; no-op when empty.
  void release() noexcept;

private:
  friend class BufferPool;
  PooledBuffer(BufferPool* pool, std::unique_ptr<char[]> block, std::size_t cap)
    : pool_(pool), block_(std::move(block)), capacity_(cap) {}

  BufferPool* pool_{nullptr};
  std::unique_ptr<char[]> block_;
  std::size_t capacity_{0};
};

class BufferPool {
public:
  // Blocks are never smaller than `min_block` bytes.
  explicit BufferPool(std::size_t min_block = 1024);
  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  PooledBuffer rent(std::size_t min_size);

  std::size_t outstanding() const;
  std::uint64_t rented_total() const;
  std::size_t high_water() const;
  std::size_t free_blocks() const;

  static BufferPool& shared();

private:
  friend class PooledBuffer;
  void give_back(std::unique_ptr<char[]> block, std::size_t cap) noexcept;

  struct FreeBlock {
    std::unique_ptr<char[]> block;
    std::size_t capacity;
  };

  std::size_t min_block_;
  mutable std::mutex mu_;
  std::vector<FreeBlock> free_;
  std::size_t outstanding_{0};
  std::uint64_t rented_{0};
  std::size_t high_water_{0};
};

}
