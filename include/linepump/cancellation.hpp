#pragma once
#include <atomic>
#include <memory>
#include <stdexcept>

namespace lp {

// Thrown by transports that report cancellation from inside a request.
class OperationCancelled : public std::runtime_error {
public:
  OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// Copyable view of a cancellation flag. A default token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool cancelled() const noexcept {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

  void throw_if_cancelled() const {
    if (cancelled()) throw OperationCancelled();
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> f) : flag_(std::move(f)) {}

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  CancellationToken token() const { return CancellationToken(flag_); }
  void cancel() noexcept { flag_->store(true, std::memory_order_release); }
  bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}
