#pragma once

#include "transport/transport.hpp"

#include <curl/curl.h>
#include <mutex>

// WebSocket transport on libcurl's connect-only WebSocket API.
class CurlWsTransport : public Transport {
public:
    CurlWsTransport();
    ~CurlWsTransport() override;

    CurlWsTransport(const CurlWsTransport&) = delete;
    CurlWsTransport& operator=(const CurlWsTransport&) = delete;

    std::expected<void, SessionError> connect(const Endpoint& endpoint,
                                              std::stop_token stop = {}) override;
    std::expected<void, SessionError> send_text(const std::string& payload) override;
    std::expected<std::optional<TransportMessage>, SessionError>
        receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    bool wait_socket(short events, int timeout_ms);
    void cleanup();

    bool curl_ready_;
    std::mutex mutex_;
    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    curl_socket_t socket_ = CURL_SOCKET_BAD;

    // Reassembly of a fragmented message.
    std::string partial_;
    TransportMessage::Type partial_type_ = TransportMessage::Type::Text;
};
