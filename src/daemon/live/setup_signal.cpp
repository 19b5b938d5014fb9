#include "live/setup_signal.hpp"

bool SetupSignal::complete(const std::function<void()>& on_success) {
    {
        std::lock_guard lock(mutex_);
        if (result_) return false;
        if (on_success) on_success();
        result_.emplace();
    }
    cv_.notify_all();
    return true;
}

bool SetupSignal::fail(SessionError error) {
    {
        std::lock_guard lock(mutex_);
        if (result_) return false;
        result_.emplace(std::unexpected(std::move(error)));
    }
    cv_.notify_all();
    return true;
}

bool SetupSignal::is_done() const {
    std::lock_guard lock(mutex_);
    return result_.has_value();
}

std::expected<void, SessionError> SetupSignal::wait(std::chrono::milliseconds timeout,
                                                    std::stop_token stop) {
    std::unique_lock lock(mutex_);
    bool done = cv_.wait_for(lock, stop, timeout, [this] { return result_.has_value(); });

    if (done) return *result_;
    if (stop.stop_requested()) {
        return std::unexpected(SessionError{SessionError::Kind::Cancelled, "setup wait cancelled"});
    }
    return std::unexpected(SessionError{
        SessionError::Kind::SetupTimeout,
        "no setup acknowledgement within " + std::to_string(timeout.count()) + " ms"});
}
