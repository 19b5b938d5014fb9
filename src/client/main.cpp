#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start               Open a live session and start capturing");
    std::println(stderr, "  stop                Stop capturing and close the session");
    std::println(stderr, "  status              Show daemon status");
    std::println(stderr, "  listen [--json]     Follow transcripts, questions and answers");
    std::println(stderr, "  ask \"<question>\"    Stream an answer to a question");
}

// Prints one streamed event. Returns false when the stream is over.
static bool print_event(const json& ev, bool raw) {
    auto kind = ev.value("event", "");

    if (raw) {
        std::println("{}", ev.dump());
        std::fflush(stdout);
        return kind != "closed";
    }

    if (kind == "transcript") {
        std::print("{}", ev.value("text", ""));
    } else if (kind == "turn") {
        std::println("");
    } else if (kind == "model") {
        std::println("[model] {}", ev.value("text", ""));
    } else if (kind == "question") {
        std::println("\nQ: {}", ev.value("question", ""));
        std::print("A: ");
    } else if (kind == "answer_chunk") {
        std::print("{}", ev.value("text", ""));
    } else if (kind == "answer_done") {
        if (ev.value("ok", false)) {
            std::println("");
        } else {
            std::println("\n[answer failed: {}]", ev.value("error", "unknown error"));
        }
    } else if (kind == "state") {
        std::println(stderr, "[{}]", ev.value("state", ""));
    } else if (kind == "reconnecting") {
        std::println(stderr, "[reconnecting {}/{}]", ev.value("attempt", 0), ev.value("max_attempts", 0));
    } else if (kind == "closed") {
        std::println(stderr, "[session closed: {}]", ev.value("error", ""));
        return false;
    }
    std::fflush(stdout);
    return true;
}

static int print_status(const json& response) {
    std::println("State: {}", response.value("state", "unknown"));
    std::println("Provider: {}", response.value("provider", ""));
    if (response.contains("streaming_duration")) {
        std::println("Streaming for: {:.1f}s", response["streaming_duration"].get<double>());
    }
    std::println("Capturing: {}", response.value("capturing", false) ? "yes" : "no");
    std::println("Reconnect attempts: {}", response.value("reconnect_attempts", 0));
    std::println("Questions answered: {}", response.value("answered_questions", 0));
    std::println("Answers in flight: {}", response.value("active_answers", 0));
    std::println("Dropped audio bytes: {}", response.value("dropped_audio_bytes", 0));
    if (response.contains("last_server_error") && response["last_server_error"].is_string()) {
        std::println("Last server error: {}", response["last_server_error"].get<std::string>());
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    bool raw = false;
    std::string question;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json") {
            raw = true;
        } else if (command == "ask") {
            if (!question.empty()) question += ' ';
            question += arg;
        }
    }

    json cmd;
    if (command == "start" || command == "stop" || command == "status" || command == "listen") {
        cmd = {{"cmd", command}};
    } else if (command == "ask") {
        if (question.empty()) {
            std::println(stderr, "ask: missing question");
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "ask"}, {"question", question}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is live-answer running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") return print_status(response);

    if (command == "listen" || command == "ask") {
        if (command == "ask") {
            std::println("Q: {}", response.value("question", question));
            std::print("A: ");
        }
        json ev;
        while (client.recv(ev, -1)) {
            if (!print_event(ev, raw)) return 1;
            if (command == "ask" && ev.value("event", "") == "answer_done") {
                return ev.value("ok", false) ? 0 : 1;
            }
        }
        return 0;
    }

    std::println("{}", response.value("message", "OK"));
    return 0;
}
