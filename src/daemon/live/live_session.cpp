#include "live/live_session.hpp"

#include <algorithm>
#include <format>
#include <print>

using Kind = SessionError::Kind;

std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::AwaitingSetup: return "awaiting_setup";
        case SessionState::Streaming: return "streaming";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

std::chrono::milliseconds ReconnectPolicy::backoff_after(uint32_t attempt) const {
    auto delay = initial_backoff;
    for (uint32_t i = 1; i < attempt && delay < max_backoff; i++) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

LiveSession::LiveSession(const LiveCodec& codec, TransportFactory transport_factory,
                         AnswerStreamer& answers, SessionObserver& observer,
                         ReconnectPolicy policy, bool cumulative_transcripts, bool verbose)
    : codec_(codec), transport_factory_(std::move(transport_factory)),
      answers_(answers), observer_(observer), policy_(policy), verbose_(verbose),
      assembler_(cumulative_transcripts) {}

LiveSession::~LiveSession() {
    disconnect();
    if (worker_.joinable() && worker_id_.load() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::expected<void, SessionError> LiveSession::connect() {
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (disconnect_requested_.load()) {
            return std::unexpected(SessionError{Kind::Cancelled, "session disconnected"});
        }
        if (state() != SessionState::Idle) {
            return std::unexpected(SessionError{Kind::TransportFailure, "session already started"});
        }
        set_state(SessionState::Connecting);
    }
    assembler_.reset();

    auto res = establish(stop_source_.get_token());

    std::lock_guard lifecycle(lifecycle_mutex_);
    if (disconnect_requested_.load()) {
        // disconnect() ran while the transport was opening.
        std::unique_ptr<Transport> transport;
        {
            std::lock_guard lock(mutex_);
            transport = std::move(transport_);
        }
        if (transport) transport->close();
        set_state(SessionState::Closed);
        return std::unexpected(SessionError{Kind::Cancelled, "session disconnected"});
    }
    if (!res) {
        std::println(stderr, "live: connect failed: {}", res.error().detail);
        set_state(SessionState::Closed);
        return res;
    }

    set_state(SessionState::AwaitingSetup);
    log("setup sent, waiting for acknowledgement");

    worker_ = std::jthread([this, stop = stop_source_.get_token()] { run(stop); });
    return {};
}

std::expected<void, SessionError>
LiveSession::wait_for_setup_complete(std::chrono::milliseconds timeout) {
    auto signal = current_signal();
    if (!signal) {
        return std::unexpected(SessionError{Kind::TransportFailure, "not connected"});
    }

    auto res = signal->wait(timeout, stop_source_.get_token());
    if (!res && res.error().kind == Kind::SetupTimeout && !signal->fail(res.error())) {
        // The acknowledgement won the race against the deadline.
        res = signal->wait(std::chrono::milliseconds(0));
    }
    if (!res) {
        std::println(stderr, "live: setup wait failed: {}", res.error().describe());
    }
    return res;
}

void LiveSession::send_audio(const AudioFrame& frame) {
    if (state() != SessionState::Streaming) return;

    auto wire = codec_.wire_format();
    auto pcm = pcm16::to_wire(frame, wire.sample_rate);
    if (pcm.empty()) return;

    auto msg = codec_.encode_audio(pcm, wire);

    std::lock_guard lock(mutex_);
    if (!transport_ || state() != SessionState::Streaming) return;

    auto res = transport_->send_text(msg);
    if (!res) {
        std::println(stderr, "live: audio chunk dropped: {}", res.error().detail);
    }
}

void LiveSession::disconnect() noexcept {
    if (disconnect_requested_.exchange(true)) return;

    try {
        stop_source_.request_stop();

        if (worker_id_.load() == std::this_thread::get_id()) {
            // Called from an observer callback. run() closes the transport on
            // its way out and the destructor joins.
            set_state(SessionState::Closed);
            return;
        }

        std::lock_guard lifecycle(lifecycle_mutex_);
        if (worker_.joinable()) {
            std::unique_lock lock(exit_mutex_);
            if (!exit_cv_.wait_for(lock, policy_.disconnect_timeout,
                                   [this] { return worker_exited_; })) {
                std::println(stderr, "live: receive loop slow to exit after {} ms",
                         policy_.disconnect_timeout.count());
            }
            lock.unlock();
            worker_.join();
        }

        std::unique_ptr<Transport> transport;
        {
            std::lock_guard lock(mutex_);
            transport = std::move(transport_);
        }
        if (transport) transport->close();

        if (auto signal = current_signal()) {
            signal->fail(SessionError{Kind::Cancelled, "session disconnected"});
        }

        set_state(SessionState::Closed);
        log("disconnected");
    } catch (const std::exception& e) {
        std::println(stderr, "live: error during disconnect: {}", e.what());
    }
}

std::expected<void, SessionError>
LiveSession::stream_answer_for_question(const std::string& question,
                                        const AnswerStreamer::ChunkCallback& on_chunk,
                                        std::stop_token stop) {
    if (text_util::is_blank(question)) return {};
    if (!stop.stop_possible()) stop = stop_source_.get_token();

    log("streaming answer for: " + question);
    return answers_.stream(question, on_chunk, stop);
}

std::optional<std::string> LiveSession::last_server_error() const {
    std::lock_guard lock(error_mutex_);
    return last_server_error_;
}

std::expected<void, SessionError> LiveSession::establish(std::stop_token stop) {
    auto transport = transport_factory_();
    if (!transport) {
        return std::unexpected(SessionError{Kind::TransportFailure, "no transport available"});
    }

    // Armed before connecting so a waiter always binds to this attempt.
    auto signal = std::make_shared<SetupSignal>();
    {
        std::lock_guard lock(mutex_);
        setup_signal_ = signal;
    }

    auto res = transport->connect(codec_.live_endpoint(), stop);
    if (!res) {
        signal->fail(res.error());
        return res;
    }

    res = transport->send_text(codec_.encode_setup());
    if (!res) {
        signal->fail(res.error());
        transport->close();
        return res;
    }

    std::lock_guard lock(mutex_);
    transport_ = std::move(transport);
    return {};
}

std::expected<std::optional<TransportMessage>, SessionError>
LiveSession::read_message(Transport& transport, std::chrono::milliseconds timeout) {
    auto msg = transport.receive(timeout);
    if (!msg) return msg;
    if (*msg && (*msg)->type == TransportMessage::Type::Close) {
        std::string detail = "closed by provider";
        if (!(*msg)->data.empty()) detail += ": " + (*msg)->data;
        return std::unexpected(SessionError{Kind::TransportFailure, std::move(detail)});
    }
    return msg;
}

std::expected<void, SessionError> LiveSession::await_setup(std::stop_token stop) {
    auto signal = current_signal();
    Transport* transport;
    {
        std::lock_guard lock(mutex_);
        transport = transport_.get();
    }
    if (!signal || !transport) {
        return std::unexpected(SessionError{Kind::TransportFailure, "not connected"});
    }

    auto deadline = std::chrono::steady_clock::now() + policy_.setup_timeout;
    while (!signal->is_done()) {
        if (stop.stop_requested()) {
            return std::unexpected(SessionError{Kind::Cancelled, "reconnect cancelled"});
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            auto timeout = SessionError{Kind::SetupTimeout, "no setup acknowledgement"};
            signal->fail(timeout);
            return std::unexpected(timeout);
        }

        auto msg = read_message(*transport, std::min(remaining, policy_.poll_interval));
        if (!msg) {
            signal->fail(msg.error());
            return std::unexpected(msg.error());
        }
        if (!*msg) continue;

        for (auto& event : codec_.decode((*msg)->data)) {
            dispatch(event);
        }
    }

    return signal->wait(std::chrono::milliseconds(0), stop);
}

void LiveSession::run(std::stop_token stop) {
    worker_id_.store(std::this_thread::get_id());
    while (!stop.stop_requested()) {
        auto failure = receive_messages(stop);
        if (stop.stop_requested() || disconnect_requested_.load()) break;

        if (!ever_streamed_.load()) {
            // Never got past setup; the caller sees the failure from
            // wait_for_setup_complete and decides what to do.
            close_with_error(std::move(failure));
            break;
        }

        std::println(stderr, "live: connection lost: {}", failure.describe());
        if (!reconnect(stop)) break;
    }

    if (disconnect_requested_.load()) {
        std::unique_ptr<Transport> transport;
        {
            std::lock_guard lock(mutex_);
            transport = std::move(transport_);
        }
        if (transport) transport->close();
    }

    {
        std::lock_guard lock(exit_mutex_);
        worker_exited_ = true;
    }
    exit_cv_.notify_all();
}

SessionError LiveSession::receive_messages(std::stop_token stop) {
    Transport* transport;
    {
        std::lock_guard lock(mutex_);
        transport = transport_.get();
    }
    if (!transport) return SessionError{Kind::TransportFailure, "not connected"};

    while (!stop.stop_requested()) {
        auto msg = read_message(*transport, policy_.poll_interval);
        if (!msg) {
            if (auto signal = current_signal()) signal->fail(msg.error());
            return msg.error();
        }
        if (!*msg) continue;

        for (auto& event : codec_.decode((*msg)->data)) {
            dispatch(event);
        }
    }
    return SessionError{Kind::Cancelled, "receive loop cancelled"};
}

bool LiveSession::reconnect(std::stop_token stop) {
    set_state(SessionState::Reconnecting);

    SessionError last{Kind::TransportFailure, "connection lost"};
    std::chrono::milliseconds waited{0};

    for (uint32_t attempt = 1; attempt <= policy_.max_attempts; attempt++) {
        if (stop.stop_requested()) return false;

        reconnect_attempts_.store(attempt, std::memory_order_relaxed);
        std::println(stderr, "live: reconnect attempt {}/{}", attempt, policy_.max_attempts);
        observer_.on_reconnect_attempt(attempt, policy_.max_attempts, waited);

        // Partial text of the interrupted turn cannot resume on a new connection.
        assembler_.discard_turn();

        std::unique_ptr<Transport> old;
        {
            std::lock_guard lock(mutex_);
            old = std::move(transport_);
        }
        if (old) old->close();

        auto res = establish(stop);
        if (res) res = await_setup(stop);
        if (res) {
            set_state(SessionState::Streaming);
            log(std::format("reconnected after {} attempt(s)", attempt));
            return true;
        }

        last = res.error();
        if (last.kind == Kind::Cancelled || stop.stop_requested()) return false;
        if (!last.is_transient() || attempt == policy_.max_attempts) break;

        waited = policy_.backoff_after(attempt);
        std::println(stderr, "live: reconnect attempt {} failed: {}, retrying in {} ms",
                     attempt, last.describe(), waited.count());

        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lock(m);
        cv.wait_for(lock, stop, waited, [] { return false; });
    }

    std::println(stderr, "live: giving up: {}", last.describe());
    close_with_error(std::move(last));
    return false;
}

void LiveSession::close_with_error(SessionError error) {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard lock(mutex_);
        transport = std::move(transport_);
    }
    if (transport) transport->close();

    if (auto signal = current_signal()) signal->fail(error);

    set_state(SessionState::Closed);
    observer_.on_session_closed(error);
}

void LiveSession::dispatch(const LiveEvent& event) {
    if (std::holds_alternative<live_event::SetupComplete>(event)) {
        auto signal = current_signal();
        // State first, so a woken waiter already observes Streaming.
        bool won = signal && signal->complete([this] {
            ever_streamed_.store(true);
            if (state() == SessionState::AwaitingSetup) {
                set_state(SessionState::Streaming);
            }
        });
        if (won) {
            log("setup complete, streaming audio");
        } else {
            std::println(stderr, "live: late setup acknowledgement ignored");
        }
    } else if (auto* delta = std::get_if<live_event::TranscriptDelta>(&event)) {
        if (auto shown = assembler_.on_delta(delta->text)) {
            observer_.on_input_transcript(*shown);
        }
    } else if (auto* output = std::get_if<live_event::ModelOutput>(&event)) {
        observer_.on_model_output(output->text);
    } else if (auto* turn = std::get_if<live_event::TurnComplete>(&event)) {
        auto text = assembler_.on_turn_complete(turn->text);
        log(text.empty() ? "turn complete (no transcript)" : "turn complete: " + text);
        observer_.on_turn_complete(text);
    } else if (auto* err = std::get_if<live_event::ProviderError>(&event)) {
        {
            std::lock_guard lock(error_mutex_);
            last_server_error_ = err->detail;
        }
        std::println(stderr, "live: provider error: {}", err->detail);
        if (auto signal = current_signal()) {
            signal->fail(SessionError{Kind::ProviderError, err->detail});
        }
    } else if (auto* failure = std::get_if<live_event::DecodeFailure>(&event)) {
        std::println(stderr, "live: undecodable message ({}): {}", failure->reason, failure->raw);
    } else if (auto* other = std::get_if<live_event::Unrecognized>(&event)) {
        log("unhandled message: " + other->raw);
    }
}

void LiveSession::set_state(SessionState state) {
    auto prev = state_.exchange(state, std::memory_order_acq_rel);
    if (prev == state) return;
    log(std::format("state {} -> {}", session_state_name(prev), session_state_name(state)));
    observer_.on_state_changed(state);
}

std::shared_ptr<SetupSignal> LiveSession::current_signal() const {
    std::lock_guard lock(mutex_);
    return setup_signal_;
}

void LiveSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-answer] live: {}", msg);
    }
}
