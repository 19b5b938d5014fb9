#pragma once

#include "answer/answer_streamer.hpp"
#include "live/live_session.hpp"
#include "platform/frame_source.hpp"
#include "platform/ipc_server.hpp"
#include "transport/transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

// Provider side of an in-memory connection. Shared by every transport the
// session's factory creates, so reconnects see the same script.
struct TransportScript {
    std::mutex m;
    std::condition_variable cv;

    // Outcome of upcoming connect() calls; empty means success.
    std::deque<bool> connect_results;
    // Every connect() after the first hangs this long unless its token stops.
    std::chrono::milliseconds reconnect_hang{0};
    // Answer the setup message with this payload. Empty: never answer.
    std::string setup_ack = R"({"setupComplete":{}})";

    std::deque<std::string> inbound;
    bool drop_pending = false;
    bool close_pending = false;

    std::vector<std::string> sent;
    int connects = 0;
    int closes = 0;

    void push(std::string msg) {
        {
            std::lock_guard lock(m);
            inbound.push_back(std::move(msg));
        }
        cv.notify_all();
    }

    // Next receive() fails as if the network went away.
    void drop() {
        {
            std::lock_guard lock(m);
            drop_pending = true;
        }
        cv.notify_all();
    }

    // Next receive() sees a close frame from the provider.
    void close_from_provider() {
        {
            std::lock_guard lock(m);
            close_pending = true;
        }
        cv.notify_all();
    }

    size_t sent_count() {
        std::lock_guard lock(m);
        return sent.size();
    }

    int connect_count() {
        std::lock_guard lock(m);
        return connects;
    }
};

class ScriptedTransport : public Transport {
public:
    explicit ScriptedTransport(std::shared_ptr<TransportScript> script)
        : script_(std::move(script)) {}

    std::expected<void, SessionError> connect(const Endpoint& /*endpoint*/,
                                              std::stop_token stop) override {
        std::unique_lock lock(script_->m);
        script_->connects++;

        if (script_->connects > 1 && script_->reconnect_hang.count() > 0) {
            std::condition_variable_any hang;
            hang.wait_for(lock, stop, script_->reconnect_hang, [] { return false; });
            if (stop.stop_requested()) {
                return std::unexpected(SessionError{SessionError::Kind::Cancelled,
                                                    "connect cancelled"});
            }
        }

        if (!script_->connect_results.empty()) {
            bool ok = script_->connect_results.front();
            script_->connect_results.pop_front();
            if (!ok) {
                return std::unexpected(SessionError{SessionError::Kind::TransportFailure,
                                                    "connection refused"});
            }
        }
        return {};
    }

    std::expected<void, SessionError> send_text(const std::string& payload) override {
        {
            std::lock_guard lock(script_->m);
            script_->sent.push_back(payload);
            if (!setup_sent_) {
                setup_sent_ = true;
                if (!script_->setup_ack.empty()) script_->inbound.push_back(script_->setup_ack);
            }
        }
        script_->cv.notify_all();
        return {};
    }

    std::expected<std::optional<TransportMessage>, SessionError>
    receive(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(script_->m);
        script_->cv.wait_for(lock, timeout, [this] {
            return !script_->inbound.empty() || script_->drop_pending || script_->close_pending;
        });

        if (script_->drop_pending) {
            script_->drop_pending = false;
            return std::unexpected(SessionError{SessionError::Kind::TransportFailure,
                                                "connection reset"});
        }
        if (script_->close_pending) {
            script_->close_pending = false;
            return TransportMessage{TransportMessage::Type::Close, "1011 going away"};
        }
        if (script_->inbound.empty()) return std::nullopt;

        auto msg = std::move(script_->inbound.front());
        script_->inbound.pop_front();
        return TransportMessage{TransportMessage::Type::Text, std::move(msg)};
    }

    void close() override {
        std::lock_guard lock(script_->m);
        if (!closed_) {
            closed_ = true;
            script_->closes++;
        }
    }

private:
    std::shared_ptr<TransportScript> script_;
    bool setup_sent_ = false;
    bool closed_ = false;
};

inline LiveSession::TransportFactory scripted_factory(std::shared_ptr<TransportScript> script) {
    return [script] { return std::make_unique<ScriptedTransport>(script); };
}

class FakeAnswerStreamer : public AnswerStreamer {
public:
    std::vector<std::string> chunks = {"Resource acquisition ", "is initialization."};
    std::optional<SessionError> failure;
    // Hold every stream open until its token is stopped.
    bool block_until_stopped = false;

    std::expected<void, SessionError>
    stream(const std::string& question, const ChunkCallback& on_chunk,
           std::stop_token stop) override {
        {
            std::lock_guard lock(m_);
            questions_.push_back(question);
        }
        cv_.notify_all();

        if (block_until_stopped) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait(lock, stop, [] { return false; });
            return std::unexpected(SessionError{SessionError::Kind::Cancelled, "stopped"});
        }

        for (auto& chunk : chunks) on_chunk(chunk);
        if (failure) return std::unexpected(*failure);
        return {};
    }

    std::vector<std::string> questions() {
        std::lock_guard lock(m_);
        return questions_;
    }

    bool wait_for_questions(size_t n, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock lock(m_);
        return cv_.wait_for(lock, timeout, [&] { return questions_.size() >= n; });
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::vector<std::string> questions_;
};

struct RecordingObserver : SessionObserver {
    std::mutex m;
    std::condition_variable cv;

    std::vector<std::string> transcripts;
    std::vector<std::string> turns;
    std::vector<std::string> model_output;
    std::vector<SessionState> states;
    std::vector<std::chrono::milliseconds> reconnect_waits;
    std::vector<SessionError> closed;

    void on_input_transcript(const std::string& text) override { record([&] { transcripts.push_back(text); }); }
    void on_turn_complete(const std::string& text) override { record([&] { turns.push_back(text); }); }
    void on_model_output(const std::string& text) override { record([&] { model_output.push_back(text); }); }
    void on_state_changed(SessionState state) override { record([&] { states.push_back(state); }); }
    void on_reconnect_attempt(uint32_t, uint32_t, std::chrono::milliseconds waited) override {
        record([&] { reconnect_waits.push_back(waited); });
    }
    void on_session_closed(const SessionError& error) override { record([&] { closed.push_back(error); }); }

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout = 3s) {
        std::unique_lock lock(m);
        return cv.wait_for(lock, timeout, pred);
    }

private:
    template <typename F>
    void record(F f) {
        {
            std::lock_guard lock(m);
            f();
        }
        cv.notify_all();
    }
};

class FakeFrameSource : public FrameSource {
public:
    bool start_result = true;

    bool start() override {
        capturing_ = start_result;
        return start_result;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }
    AudioFormat format() const override { return {}; }

    std::optional<AudioFrame> next_frame(size_t max_bytes) override {
        if (pending_.empty()) return std::nullopt;
        size_t n = std::min(max_bytes, pending_.size());
        AudioFrame frame{{pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n)}, {}};
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        return frame;
    }
    uint64_t dropped_bytes() const override { return 0; }

    void feed(size_t bytes) { pending_.insert(pending_.end(), bytes, 0); }

private:
    bool capturing_ = false;
    std::vector<uint8_t> pending_;
};

// Records replies instead of writing to sockets.
class RecordingIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_commands(int, std::vector<nlohmann::json>&) override { return ReadStatus::Ok; }
    bool send_response(int client_fd, const nlohmann::json& response) override {
        sent.emplace_back(client_fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<nlohmann::json> sent_to(int fd) const {
        std::vector<nlohmann::json> out;
        for (auto& [to, msg] : sent) {
            if (to == fd) out.push_back(msg);
        }
        return out;
    }

    std::vector<std::pair<int, nlohmann::json>> sent;
};
