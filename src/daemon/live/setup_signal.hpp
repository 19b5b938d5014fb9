#pragma once

#include "live/session_error.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>

// Single-fire completion for the setup handshake of one connection attempt.
// The first complete() or fail() wins; later calls are ignored. Waiters see
// success, the failure, SetupTimeout, or Cancelled when their token fires.
class SetupSignal {
public:
    // Returns false if the signal had already fired. `on_success` runs before
    // any waiter is released, and only when this call wins.
    bool complete(const std::function<void()>& on_success = {});
    bool fail(SessionError error);

    bool is_done() const;

    std::expected<void, SessionError> wait(std::chrono::milliseconds timeout,
                                           std::stop_token stop = {});

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::optional<std::expected<void, SessionError>> result_;
};
