#pragma once

#include <atomic>

namespace hm::runtime
{

// Both requests are async-signal-safe: they only store to lock-free atomics.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;

void request_refresh() noexcept;
// Returns true once per batch of refresh requests.
bool consume_refresh_request() noexcept;

} // namespace hm::runtime
