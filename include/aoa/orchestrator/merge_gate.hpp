#pragma once

#include "aoa/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstddef>
#include <utility>

namespace aoa {

/// The single lock of the orchestrator. Serializes merge-back into the
/// shared workspace; waiters are admitted in arrival order.
///
/// A one-slot channel acts as the token: acquiring sends into the slot
/// (suspending while it is full) and releasing drains it.
class MergeGate {
  using TokenChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code)>;

public:
  class Guard {
  public:
    Guard() = default;
    explicit Guard(MergeGate *gate) noexcept : gate_(gate) {}
    ~Guard() { release(); }

    Guard(Guard &&other) noexcept
        : gate_(std::exchange(other.gate_, nullptr)) {}
    Guard &operator=(Guard &&other) noexcept {
      if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
      }
      return *this;
    }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

    [[nodiscard]] auto owns() const noexcept -> bool {
      return gate_ != nullptr;
    }

    auto release() noexcept -> void {
      if (auto *gate = std::exchange(gate_, nullptr)) {
        gate->unlock();
      }
    }

  private:
    MergeGate *gate_{nullptr};
  };

  explicit MergeGate(boost::asio::any_io_executor executor)
      : token_(std::move(executor), 1) {}

  MergeGate(const MergeGate &) = delete;
  MergeGate &operator=(const MergeGate &) = delete;

  [[nodiscard]] auto acquire() -> task<Guard>;

  [[nodiscard]] auto holders() const noexcept -> int {
    return holders_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto acquisitions() const noexcept -> std::size_t {
    return acquisitions_.load(std::memory_order_relaxed);
  }

private:
  auto unlock() noexcept -> void;

  TokenChannel token_;
  std::atomic<int> holders_{0};
  std::atomic<std::size_t> acquisitions_{0};
};

} // namespace aoa
