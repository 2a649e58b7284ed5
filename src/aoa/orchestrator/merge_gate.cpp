#include "aoa/orchestrator/merge_gate.hpp"

#include "aoa/util/log.hpp"

#include <boost/asio/use_awaitable.hpp>

namespace aoa {

auto MergeGate::acquire() -> task<Guard> {
  co_await token_.async_send(boost::system::error_code{},
                             boost::asio::use_awaitable);
  holders_.fetch_add(1, std::memory_order_acq_rel);
  acquisitions_.fetch_add(1, std::memory_order_relaxed);
  co_return Guard{this};
}

auto MergeGate::unlock() noexcept -> void {
  holders_.fetch_sub(1, std::memory_order_acq_rel);
  const bool drained =
      token_.try_receive([](const boost::system::error_code &) {});
  if (!drained) {
    log::error("merge gate released without being held");
  }
}

} // namespace aoa
