#pragma once
#include "linepump/buffer_pool.hpp"
#include "linepump/cancellation.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <future>
#include <istream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace lp {

// Fills up to `capacity` elements at `dest`; resolves with the count, 0 at end.
template <typename T>
using FillFn = std::function<std::future<std::size_t>(T* dest, std::size_t capacity)>;

template <typename T>
struct BufferView {
  const T* data = nullptr;
  std::size_t size = 0;
};

namespace detail {

template <typename T>
class PumpBase {
  static_assert(std::is_trivially_copyable<T>::value, "pump element must be trivially copyable");

public:
  PumpBase(FillFn<T> fill, std::size_t buffer_size, CancellationToken token, BufferPool* pool)
    : fill_(std::move(fill)), size_(buffer_size), token_(std::move(token)),
      pool_(pool ? pool : &BufferPool::shared()) {
    if (size_ == 0) throw std::invalid_argument("pump buffer size must be > 0");
    if (!fill_) throw std::invalid_argument("pump fill function is empty");
  }
  PumpBase(const PumpBase&) = delete;
  PumpBase& operator=(const PumpBase&) = delete;

  bool failed() const noexcept { return failed_; }
  bool cancelled() const noexcept { return cancelled_; }
  bool done() const noexcept { return done_; }
  const std::string& error() const noexcept { return err_; }
  std::uint64_t reads_issued() const noexcept { return reads_; }
  std::uint64_t units_yielded() const noexcept { return yielded_; }
  std::uint64_t elements_yielded() const noexcept { return elements_; }
  std::size_t buffer_size() const noexcept { return size_; }

protected:
  T* rent(PooledBuffer& slot) {
    slot = pool_->rent(size_ * sizeof(T));
    // pool blocks come from new char[] and are aligned for any T
    return static_cast<T*>(static_cast<void*>(slot.data()));
  }

  std::future<std::size_t> issue(T* dest) {
    ++reads_;
    return fill_(dest, size_);
  }

  std::size_t await(std::future<std::size_t>& f) {
    const std::size_t n = f.get();
    if (n > size_) throw std::length_error("fill reported more elements than the buffer holds");
    return n;
  }

  void yielded(std::size_t n) noexcept { ++yielded_; elements_ += n; }

  void mark_failed(const char* what) { failed_ = true; err_ = what; }
  void mark_cancelled() noexcept { cancelled_ = true; }
  void mark_done() noexcept { done_ = true; }

  // An issued fill is never preempted: wait for it before its buffer goes back.
  static void settle(std::future<std::size_t>& f) {
    if (f.valid()) f.wait();
    f = std::future<std::size_t>();
  }

  FillFn<T> fill_;
  std::size_t size_;
  CancellationToken token_;
  BufferPool* pool_;

private:
  bool failed_{false};
  bool cancelled_{false};
  bool done_{false};
  std::string err_;
  std::uint64_t reads_{0};
  std::uint64_t yielded_{0};
  std::uint64_t elements_{0};
};

}

// Two rotating buffers: the fill for block N+1 is issued before block N is
// handed out, so the read overlaps whatever the consumer does with block N.
// A view stays valid only until the next call to next().
template <typename T>
class DoubleBufferPump : public detail::PumpBase<T> {
  using Base = detail::PumpBase<T>;

public:
  DoubleBufferPump(FillFn<T> fill, std::size_t buffer_size,
                   CancellationToken token = {}, BufferPool* pool = nullptr)
    : Base(std::move(fill), buffer_size, std::move(token), pool) {}

  ~DoubleBufferPump() { shutdown(); }

  bool next(BufferView<T>& out) {
    if (this->done()) return false;
    try {
      if (this->token_.cancelled()) {
        this->mark_cancelled();
        shutdown();
        return false;
      }
      if (!started_) {
        started_ = true;
        next_ = this->rent(a_);
        current_ = this->rent(b_);
        pending_ = this->issue(next_);
      }

      const std::size_t n = this->await(pending_);
      if (n == 0) {
        shutdown();
        return false;
      }

      // preemptive request before yielding
      T* filled = next_;
      pending_ = this->issue(current_);
      std::swap(next_, current_);

      out.data = filled;
      out.size = n;
      this->yielded(n);
      return true;
    } catch (const std::exception& e) {
      this->mark_failed(e.what());
      shutdown();
      return false;
    }
  }

private:
  void shutdown() {
    Base::settle(pending_);
    a_.release();
    b_.release();
    next_ = current_ = nullptr;
    this->mark_done();
  }

  PooledBuffer a_, b_;
  T* next_{nullptr};
  T* current_{nullptr};
  std::future<std::size_t> pending_;
  bool started_{false};
};

// One buffer, request then yield, no overlap.
template <typename T>
class SingleBufferPump : public detail::PumpBase<T> {
  using Base = detail::PumpBase<T>;

public:
  SingleBufferPump(FillFn<T> fill, std::size_t buffer_size,
                   CancellationToken token = {}, BufferPool* pool = nullptr)
    : Base(std::move(fill), buffer_size, std::move(token), pool) {}

  ~SingleBufferPump() { shutdown(); }

  bool next(BufferView<T>& out) {
    if (this->done()) return false;
    try {
      if (this->token_.cancelled()) {
        this->mark_cancelled();
        shutdown();
        return false;
      }
      if (!buf_) data_ = this->rent(buf_);

      pending_ = this->issue(data_);
      const std::size_t n = this->await(pending_);
      if (n == 0) {
        shutdown();
        return false;
      }
      out.data = data_;
      out.size = n;
      this->yielded(n);
      return true;
    } catch (const std::exception& e) {
      this->mark_failed(e.what());
      shutdown();
      return false;
    }
  }

private:
  void shutdown() {
    Base::settle(pending_);
    buf_.release();
    data_ = nullptr;
    this->mark_done();
  }

  PooledBuffer buf_;
  T* data_{nullptr};
  std::future<std::size_t> pending_;
};

// Fill functions over common transports; each read runs on std::async.
FillFn<char> file_fill(std::FILE* f);
FillFn<char> stream_fill(std::istream& in);

}
