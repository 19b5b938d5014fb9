#pragma once

#include "live/session_error.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

struct Endpoint {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
};

struct TransportMessage {
    enum class Type { Text, Binary, Close };

    Type type = Type::Text;
    std::string data;
};

// A single persistent full-duplex message channel.
class Transport {
public:
    virtual ~Transport() = default;

    // Returns Cancelled promptly once `stop` is requested.
    virtual std::expected<void, SessionError> connect(const Endpoint& endpoint,
                                                      std::stop_token stop = {}) = 0;
    virtual std::expected<void, SessionError> send_text(const std::string& payload) = 0;

    // std::nullopt when nothing arrived within timeout.
    virtual std::expected<std::optional<TransportMessage>, SessionError>
        receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};
