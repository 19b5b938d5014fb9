#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

DaemonCore::DaemonCore(Config config, bool verbose,
                       FrameSource& audio, IpcServer& ipc,
                       BackendFactory backend_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio), ipc_(ipc),
      backend_factory_(std::move(backend_factory)),
      notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    auto backend = backend_factory_(config_.provider);
    if (!backend) {
        std::println(stderr, "Provider setup failed: {}", backend.error());
        return false;
    }
    backend_ = std::move(*backend);
    if (!backend_.codec || !backend_.answers || !backend_.transport_factory) {
        std::println(stderr, "Provider setup failed: incomplete backend for {}", config_.provider.type);
        return false;
    }

    trigger_ = std::make_unique<QuestionTrigger>(*backend_.answers, *this, verbose_);

    if (config_.provider.credential().empty()) {
        std::println(stderr, "Warning: no API key for provider {}, sessions will fail to start",
                     config_.provider.type);
    }
    return true;
}

std::optional<json> DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (!cmd.is_object()) {
        return json{{"status", "error"}, {"message", "invalid command"}};
    }

    std::string cmd_str = cmd.value("cmd", "");
    if (cmd_str == "start") return handle_start(client_fd);
    if (cmd_str == "stop") return handle_stop();
    if (cmd_str == "status") return handle_status();
    if (cmd_str == "listen") return handle_listen(client_fd);
    if (cmd_str == "ask") return handle_ask(client_fd, cmd);
    return json{{"status", "error"}, {"message", "unknown command"}};
}

std::optional<json> DaemonCore::handle_start(int client_fd) {
    if (starting_) {
        waiting_clients_.push_back(client_fd);
        return std::nullopt;
    }
    if (session_active()) {
        return json{{"status", "error"}, {"message", "session already running"}};
    }
    if (config_.provider.credential().empty()) {
        return json{{"status", "error"},
                    {"message", "no API key configured for " + config_.provider.type}};
    }

    // Joins the receive thread of a previous, closed session.
    session_.reset();
    session_ = std::make_unique<LiveSession>(
        *backend_.codec, backend_.transport_factory, *backend_.answers, *this,
        reconnect_policy(), config_.provider.cumulative_transcripts, verbose_);

    trigger_->reset();
    starting_ = true;
    waiting_clients_.push_back(client_fd);

    log("Connecting to " + config_.provider.type);

    start_worker_ = std::jthread([this, session = session_.get(),
                                  timeout = reconnect_policy().setup_timeout] {
        auto res = session->connect();
        if (res) res = session->wait_for_setup_complete(timeout);
        if (!res) session->disconnect();

        json outcome = {{"event", "start_result"}, {"ok", res.has_value()}};
        if (!res) outcome["error"] = res.error().describe();
        post(std::move(outcome));
    });

    return std::nullopt;
}

void DaemonCore::finish_start(const json& outcome) {
    if (start_worker_.joinable()) {
        start_worker_.join();
    }
    starting_ = false;

    json response;
    if (outcome.value("ok", false) && session_ && session_->state() == SessionState::Streaming) {
        if (audio_.start()) {
            streaming_since_ = std::chrono::steady_clock::now();
            log("Session streaming, capture started");
            response = {{"status", "ok"}, {"message", "streaming"}, {"provider", config_.provider.type}};
        } else {
            stop_session();
            response = {{"status", "error"}, {"message", "failed to start audio capture"}};
        }
    } else {
        auto error = outcome.value("error", std::string("session closed during setup"));
        log("Session failed to start: " + error);
        response = {{"status", "error"}, {"message", error}};
        if (session_) {
            if (auto server_error = session_->last_server_error()) {
                response["server_error"] = *server_error;
            }
        }
    }

    for (int fd : waiting_clients_) {
        if (!ipc_.send_response(fd, response)) {
            log(std::format("Start reply to client {} failed", fd));
        }
    }
    waiting_clients_.clear();
}

json DaemonCore::handle_stop() {
    if (!starting_ && !session_active()) {
        return {{"status", "error"}, {"message", "no session running"}};
    }

    stop_session();
    log("Session stopped");
    return {{"status", "ok"}, {"message", "stopped"}};
}

void DaemonCore::stop_session() {
    audio_.stop();
    if (session_) session_->disconnect();
    streaming_since_.reset();
}

json DaemonCore::handle_status() {
    json resp = {{"status", "ok"}, {"provider", config_.provider.type}};

    if (starting_ && (!session_ || session_->state() == SessionState::Idle)) {
        resp["state"] = session_state_name(SessionState::Connecting);
    } else {
        resp["state"] = session_ ? session_state_name(session_->state())
                                 : session_state_name(SessionState::Idle);
    }

    if (streaming_since_) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - *streaming_since_;
        resp["streaming_duration"] = elapsed.count();
    }

    resp["capturing"] = audio_.is_capturing();
    resp["dropped_audio_bytes"] = audio_.dropped_bytes();
    resp["reconnect_attempts"] = session_ ? session_->reconnect_attempts() : 0u;
    resp["answered_questions"] = trigger_ ? trigger_->answered_count() : 0u;
    resp["active_answers"] = trigger_ ? trigger_->active_answers() : 0u;
    resp["questions_enabled"] = config_.questions.enabled;

    std::optional<std::string> server_error;
    if (session_) server_error = session_->last_server_error();
    resp["last_server_error"] = server_error ? json(*server_error) : json(nullptr);
    return resp;
}

json DaemonCore::handle_listen(int client_fd) {
    if (std::ranges::find(listeners_, client_fd) == listeners_.end()) {
        listeners_.push_back(client_fd);
    }
    log(std::format("Client {} listening", client_fd));
    return {{"status", "ok"}, {"listening", true}};
}

std::optional<json> DaemonCore::handle_ask(int client_fd, const json& cmd) {
    std::string question;
    if (cmd.contains("question") && cmd["question"].is_string()) {
        question = cmd["question"].get<std::string>();
    }
    if (text_util::is_blank(question)) {
        return json{{"status", "error"}, {"message", "missing question"}};
    }
    if (!trigger_) {
        return json{{"status", "error"}, {"message", "provider not configured"}};
    }

    auto claimed = trigger_->ask(question);
    if (!claimed) {
        return json{{"status", "error"}, {"message", "question already answered"}};
    }

    askers_.emplace(*claimed, client_fd);
    if (!ipc_.send_response(client_fd, {{"status", "ok"}, {"question", *claimed}})) {
        log(std::format("Ask reply to client {} failed", client_fd));
    }
    return std::nullopt;
}

void DaemonCore::drain_events() {
    std::deque<json> events;
    {
        std::lock_guard lock(events_mutex_);
        events.swap(events_);
    }

    for (auto& ev : events) {
        auto kind = ev.value("event", "");
        if (kind == "start_result") {
            finish_start(ev);
        } else if (kind == "closed") {
            end_session(ev);
        } else if (kind == "answer_chunk" || kind == "answer_done") {
            route_answer_event(ev);
        } else {
            broadcast(ev);
        }
    }
}

void DaemonCore::end_session(const json& event) {
    // Reconnects exhausted or a fatal provider error. The session object is
    // kept until the next start so status can still report its last error.
    audio_.stop();
    streaming_since_.reset();
    log("Session closed: " + event.value("error", ""));
    broadcast(event);
}

void DaemonCore::pump_audio() {
    if (!audio_.is_capturing()) return;

    size_t max_bytes = bytes_per_chunk();
    while (auto frame = audio_.next_frame(max_bytes)) {
        // Frames arriving while not Streaming are dropped by the session.
        if (session_) session_->send_audio(*frame);
    }
}

void DaemonCore::remove_client(int fd) {
    std::erase(listeners_, fd);
    std::erase(waiting_clients_, fd);
    std::erase_if(askers_, [fd](const auto& entry) { return entry.second == fd; });
}

void DaemonCore::shutdown() {
    if (trigger_) trigger_->cancel_all();
    if (session_) session_->disconnect();
    if (start_worker_.joinable()) start_worker_.join();
    audio_.stop();
    session_.reset();
    starting_ = false;
}

void DaemonCore::on_input_transcript(const std::string& text) {
    post({{"event", "transcript"}, {"text", text}});
}

void DaemonCore::on_turn_complete(const std::string& text) {
    post({{"event", "turn"}, {"text", text}, {"empty", text.empty()}});

    if (!text.empty() && config_.questions.enabled && trigger_) {
        trigger_->on_turn_complete(text);
    }
}

void DaemonCore::on_model_output(const std::string& text) {
    post({{"event", "model"}, {"text", text}});
}

void DaemonCore::on_state_changed(SessionState state) {
    post({{"event", "state"}, {"state", session_state_name(state)}});
}

void DaemonCore::on_reconnect_attempt(uint32_t attempt, uint32_t max_attempts,
                                      std::chrono::milliseconds waited) {
    post({{"event", "reconnecting"}, {"attempt", attempt},
          {"max_attempts", max_attempts}, {"waited_ms", waited.count()}});
}

void DaemonCore::on_session_closed(const SessionError& error) {
    post({{"event", "closed"}, {"error", error.describe()},
          {"kind", SessionError::kind_name(error.kind)}});
}

void DaemonCore::on_question_detected(const std::string& question) {
    post({{"event", "question"}, {"question", question}});
}

void DaemonCore::on_answer_chunk(const std::string& question, const std::string& chunk) {
    post({{"event", "answer_chunk"}, {"question", question}, {"text", chunk}});
}

void DaemonCore::on_answer_complete(const std::string& question,
                                    const std::expected<void, SessionError>& result) {
    json ev = {{"event", "answer_done"}, {"question", question}, {"ok", result.has_value()}};
    if (!result) ev["error"] = result.error().describe();
    post(std::move(ev));
}

void DaemonCore::post(json event) {
    {
        std::lock_guard lock(events_mutex_);
        events_.push_back(std::move(event));
    }
    if (notify_) notify_();
}

void DaemonCore::broadcast(const json& event) {
    for (int fd : listeners_) {
        if (!ipc_.send_response(fd, event)) {
            log(std::format("Event delivery to client {} failed", fd));
        }
    }
}

void DaemonCore::route_answer_event(const json& event) {
    broadcast(event);

    auto question = event.value("question", "");
    auto [first, last] = askers_.equal_range(question);
    for (auto it = first; it != last; ++it) {
        if (std::ranges::find(listeners_, it->second) != listeners_.end()) continue;
        if (!ipc_.send_response(it->second, event)) {
            log(std::format("Answer delivery to client {} failed", it->second));
        }
    }

    if (event.value("event", "") == "answer_done") {
        askers_.erase(question);
    }
}

ReconnectPolicy DaemonCore::reconnect_policy() const {
    using std::chrono::seconds;
    ReconnectPolicy policy;
    policy.max_attempts = config_.session.max_reconnect_attempts;
    policy.initial_backoff = seconds(config_.session.initial_backoff_s);
    policy.max_backoff = seconds(config_.session.max_backoff_s);
    policy.setup_timeout = seconds(config_.session.setup_timeout_s);
    policy.disconnect_timeout = seconds(config_.session.disconnect_timeout_s);
    return policy;
}

size_t DaemonCore::bytes_per_chunk() const {
    auto fmt = audio_.format();
    size_t bytes = static_cast<size_t>(fmt.sample_rate) * fmt.block_align() * config_.audio.chunk_ms / 1000;
    bytes -= bytes % std::max<size_t>(fmt.block_align(), 1);
    return std::max<size_t>(bytes, fmt.block_align());
}

bool DaemonCore::session_active() const {
    if (!session_) return false;
    auto state = session_->state();
    return state != SessionState::Idle && state != SessionState::Closed;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-answer] {}", msg);
    }
}
