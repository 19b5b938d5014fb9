#pragma once

#include "answer/answer_streamer.hpp"
#include "config.hpp"
#include "live/live_session.hpp"
#include "live/message_codec.hpp"
#include "platform/frame_source.hpp"
#include "platform/ipc_server.hpp"
#include "questions/question_trigger.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Provider-specific collaborators, built once from the provider config.
struct LiveBackend {
    std::unique_ptr<LiveCodec> codec;
    LiveSession::TransportFactory transport_factory;
    // Built from the codec; must not outlive it.
    std::unique_ptr<AnswerStreamer> answers;
};

class DaemonCore : public SessionObserver, public QuestionObserver {
public:
    using BackendFactory =
        std::function<std::expected<LiveBackend, std::string>(const Config::Provider&)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               FrameSource& audio, IpcServer& ipc,
               BackendFactory backend_factory, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Returns the reply for the client, or std::nullopt when the reply is
    // deferred (start) or replaced by streamed events (ask).
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Event loop thread, after the notify callback fired.
    void drain_events();

    // Event loop thread, every audio.chunk_ms.
    void pump_audio();

    void remove_client(int fd);

    void shutdown();

    // SessionObserver (session receive thread)
    void on_input_transcript(const std::string& text) override;
    void on_turn_complete(const std::string& text) override;
    void on_model_output(const std::string& text) override;
    void on_state_changed(SessionState state) override;
    void on_reconnect_attempt(uint32_t attempt, uint32_t max_attempts,
                              std::chrono::milliseconds waited) override;
    void on_session_closed(const SessionError& error) override;

    // QuestionObserver (answer threads)
    void on_question_detected(const std::string& question) override;
    void on_answer_chunk(const std::string& question, const std::string& chunk) override;
    void on_answer_complete(const std::string& question,
                            const std::expected<void, SessionError>& result) override;

private:
    std::optional<nlohmann::json> handle_start(int client_fd);
    nlohmann::json handle_stop();
    nlohmann::json handle_status();
    nlohmann::json handle_listen(int client_fd);
    std::optional<nlohmann::json> handle_ask(int client_fd, const nlohmann::json& cmd);

    void finish_start(const nlohmann::json& outcome);
    void end_session(const nlohmann::json& event);
    void stop_session();

    // Thread-safe; wakes the event loop.
    void post(nlohmann::json event);
    void broadcast(const nlohmann::json& event);
    void route_answer_event(const nlohmann::json& event);

    ReconnectPolicy reconnect_policy() const;
    size_t bytes_per_chunk() const;
    bool session_active() const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    FrameSource& audio_;
    IpcServer& ipc_;

    BackendFactory backend_factory_;
    NotifyCallback notify_;

    LiveBackend backend_;
    std::unique_ptr<QuestionTrigger> trigger_;
    std::unique_ptr<LiveSession> session_;

    // Runs connect() and the setup wait off the event loop.
    std::jthread start_worker_;
    bool starting_ = false;
    std::vector<int> waiting_clients_;
    std::optional<std::chrono::steady_clock::time_point> streaming_since_;

    std::vector<int> listeners_;
    // Clients that asked a question explicitly, by question text.
    std::multimap<std::string, int> askers_;

    std::mutex events_mutex_;
    std::deque<nlohmann::json> events_;
};
