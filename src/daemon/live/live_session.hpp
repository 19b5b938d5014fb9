#pragma once

#include "answer/answer_streamer.hpp"
#include "audio_frame.hpp"
#include "live/message_codec.hpp"
#include "live/session_error.hpp"
#include "live/setup_signal.hpp"
#include "transcript/transcript_assembler.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

enum class SessionState { Idle, Connecting, AwaitingSetup, Streaming, Reconnecting, Closed };

std::string_view session_state_name(SessionState state);

struct ReconnectPolicy {
    uint32_t max_attempts = 5;
    std::chrono::milliseconds initial_backoff{2000};
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::milliseconds setup_timeout{10000};
    std::chrono::milliseconds disconnect_timeout{2000};
    // Granularity of the receive loop's cancellation checks.
    std::chrono::milliseconds poll_interval{200};

    // Delay after failed attempt `attempt` (1-based).
    std::chrono::milliseconds backoff_after(uint32_t attempt) const;
};

// Notifications from the session. Message-driven callbacks run on the
// session's receive thread, in the order the provider's messages arrived;
// state changes are also reported from the threads calling connect() and
// disconnect().
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_input_transcript(const std::string& /*text*/) {}
    // Empty text marks a turn that carried no content.
    virtual void on_turn_complete(const std::string& /*text*/) {}
    virtual void on_model_output(const std::string& /*text*/) {}
    virtual void on_state_changed(SessionState /*state*/) {}
    // `waited` is the backoff slept before this attempt (zero for the first).
    virtual void on_reconnect_attempt(uint32_t /*attempt*/, uint32_t /*max_attempts*/,
                                      std::chrono::milliseconds /*waited*/) {}
    // Exactly once, when the session gives up after a fatal error or
    // exhausted reconnects. Not called for disconnect().
    virtual void on_session_closed(const SessionError& /*error*/) {}
};

class LiveSession {
public:
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    LiveSession(const LiveCodec& codec, TransportFactory transport_factory,
                AnswerStreamer& answers, SessionObserver& observer,
                ReconnectPolicy policy = {}, bool cumulative_transcripts = false,
                bool verbose = false);
    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    // Idle -> Connecting -> AwaitingSetup. Opens the transport, sends the
    // setup message and starts the receive thread.
    std::expected<void, SessionError> connect();

    // Blocks until the provider acknowledges setup, reports an error, the
    // timeout elapses, or the session is disconnected. A timeout is final for
    // this connection: a later acknowledgement no longer starts streaming.
    std::expected<void, SessionError> wait_for_setup_complete(std::chrono::milliseconds timeout);

    // Dropped silently unless Streaming. Send failures are logged only.
    void send_audio(const AudioFrame& frame);

    // Idempotent and never throws. Also cancels a connect() or setup wait in
    // progress on another thread. Every blocking step of the receive thread
    // observes the session's stop token, so the join is bounded by the
    // transport's cancellation latency.
    void disconnect() noexcept;

    // Without a token of its own the stream is bound to the session's
    // cancellation.
    std::expected<void, SessionError>
        stream_answer_for_question(const std::string& question,
                                   const AnswerStreamer::ChunkCallback& on_chunk,
                                   std::stop_token stop = {});

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    std::optional<std::string> last_server_error() const;
    uint32_t reconnect_attempts() const { return reconnect_attempts_.load(std::memory_order_relaxed); }
    std::string current_turn() const { return assembler_.current_turn(); }

private:
    std::expected<void, SessionError> establish(std::stop_token stop);
    std::expected<void, SessionError> await_setup(std::stop_token stop);
    std::expected<std::optional<TransportMessage>, SessionError>
        read_message(Transport& transport, std::chrono::milliseconds timeout);

    void run(std::stop_token stop);
    // Reads until the transport closes or fails. Returns the failure.
    SessionError receive_messages(std::stop_token stop);
    bool reconnect(std::stop_token stop);
    void close_with_error(SessionError error);

    void dispatch(const LiveEvent& event);
    void set_state(SessionState state);
    std::shared_ptr<SetupSignal> current_signal() const;
    void log(const std::string& msg);

    const LiveCodec& codec_;
    TransportFactory transport_factory_;
    AnswerStreamer& answers_;
    SessionObserver& observer_;
    ReconnectPolicy policy_;
    bool verbose_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<uint32_t> reconnect_attempts_{0};
    std::atomic<bool> disconnect_requested_{false};
    std::atomic<bool> ever_streamed_{false};

    // Guards transport_ and setup_signal_. Sends hold it for the duration of
    // the call so the transport cannot be swapped underneath them.
    mutable std::mutex mutex_;
    std::unique_ptr<Transport> transport_;
    std::shared_ptr<SetupSignal> setup_signal_;

    mutable std::mutex error_mutex_;
    std::optional<std::string> last_server_error_;

    TranscriptAssembler assembler_;

    // Serializes starting the receive thread against joining it. Not held
    // while connect() opens the transport.
    std::mutex lifecycle_mutex_;
    std::stop_source stop_source_;
    std::jthread worker_;
    std::atomic<std::thread::id> worker_id_{};
    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    bool worker_exited_ = false;
};
