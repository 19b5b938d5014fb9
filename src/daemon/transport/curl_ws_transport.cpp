#include "transport/curl_ws_transport.hpp"

#include "transport/curl_global.hpp"

#include <cerrno>
#include <cstring>
#include <curl/websockets.h>
#include <poll.h>
#include <print>

using Kind = SessionError::Kind;

namespace {

std::unexpected<SessionError> transport_error(std::string detail) {
    return std::unexpected(SessionError{Kind::TransportFailure, std::move(detail)});
}

// libcurl calls this through the handshake, at least once a second.
int connect_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop && stop->stop_requested() ? 1 : 0;
}

} // namespace

CurlWsTransport::CurlWsTransport() : curl_ready_(curl_global::acquire()) {}

CurlWsTransport::~CurlWsTransport() {
    close();
    if (curl_ready_) curl_global::release();
}

std::expected<void, SessionError> CurlWsTransport::connect(const Endpoint& endpoint,
                                                           std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (!curl_ready_) return transport_error("curl unavailable");
    if (curl_) return transport_error("already connected");

    curl_ = curl_easy_init();
    if (!curl_) return transport_error("curl_easy_init failed");

    for (auto& h : endpoint.headers) {
        headers_ = curl_slist_append(headers_, h.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, endpoint.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, connect_progress);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);

    CURLcode res = curl_easy_perform(curl_);

    // The token dies with this call; receives must not consult it.
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, nullptr);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        cleanup();
        return std::unexpected(SessionError{Kind::Cancelled, "connect cancelled"});
    }
    if (res != CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        cleanup();
        std::string detail = std::string("connect failed: ") + curl_easy_strerror(res);
        if (status > 0) detail += " (HTTP " + std::to_string(status) + ")";
        return transport_error(std::move(detail));
    }

    res = curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &socket_);
    if (res != CURLE_OK || socket_ == CURL_SOCKET_BAD) {
        cleanup();
        return transport_error("no active socket after connect");
    }

    partial_.clear();
    return {};
}

std::expected<void, SessionError> CurlWsTransport::send_text(const std::string& payload) {
    std::lock_guard lock(mutex_);
    if (!curl_) return transport_error("not connected");

    size_t offset = 0;
    while (offset < payload.size()) {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, payload.data() + offset, payload.size() - offset,
                                    &sent, 0, CURLWS_TEXT);
        if (res == CURLE_AGAIN) {
            if (!wait_socket(POLLOUT, 1000)) return transport_error("send timed out");
            continue;
        }
        if (res != CURLE_OK) {
            return transport_error(std::string("send failed: ") + curl_easy_strerror(res));
        }
        offset += sent;
    }
    return {};
}

std::expected<std::optional<TransportMessage>, SessionError>
CurlWsTransport::receive(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[16 * 1024];

    while (true) {
        size_t rlen = 0;
        const curl_ws_frame* meta = nullptr;
        CURLcode res;
        {
            std::lock_guard lock(mutex_);
            if (!curl_) return transport_error("not connected");
            res = curl_ws_recv(curl_, buf, sizeof(buf), &rlen, &meta);
        }

        if (res == CURLE_AGAIN) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) return std::nullopt;

            pollfd pfd{.fd = socket_, .events = POLLIN, .revents = 0};
            int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ret < 0 && errno != EINTR) {
                return transport_error(std::string("poll failed: ") + std::strerror(errno));
            }
            if (ret == 0) return std::nullopt;
            if (pfd.revents & (POLLERR | POLLNVAL)) {
                return transport_error("socket error");
            }
            continue;
        }

        if (res != CURLE_OK) {
            return transport_error(std::string("receive failed: ") + curl_easy_strerror(res));
        }
        if (!meta) continue;

        if (meta->flags & CURLWS_CLOSE) {
            partial_.clear();
            return TransportMessage{.type = TransportMessage::Type::Close,
                                    .data = std::string(buf, rlen)};
        }
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;

        if (partial_.empty()) {
            partial_type_ = (meta->flags & CURLWS_BINARY) ? TransportMessage::Type::Binary
                                                          : TransportMessage::Type::Text;
        }
        partial_.append(buf, rlen);

        bool frame_done = meta->bytesleft == 0;
        bool message_done = frame_done && !(meta->flags & CURLWS_CONT);
        if (message_done) {
            TransportMessage msg{.type = partial_type_, .data = std::move(partial_)};
            partial_.clear();
            return msg;
        }
    }
}

void CurlWsTransport::close() {
    std::lock_guard lock(mutex_);
    if (!curl_) return;

    size_t sent = 0;
    CURLcode res = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
    if (res != CURLE_OK && res != CURLE_AGAIN) {
        std::println(stderr, "transport: close frame not sent: {}", curl_easy_strerror(res));
    }
    cleanup();
}

bool CurlWsTransport::wait_socket(short events, int timeout_ms) {
    pollfd pfd{.fd = socket_, .events = events, .revents = 0};
    return ::poll(&pfd, 1, timeout_ms) > 0;
}

void CurlWsTransport::cleanup() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    socket_ = CURL_SOCKET_BAD;
}
