#include "utils/Shutdown.hpp"

#include <atomic>

namespace hm::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
std::atomic_bool g_refresh_requested{false};
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void request_refresh() noexcept {
  g_refresh_requested.store(true, std::memory_order_relaxed);
}

bool consume_refresh_request() noexcept {
  return g_refresh_requested.exchange(false, std::memory_order_acq_rel);
}

} // namespace hm::runtime
