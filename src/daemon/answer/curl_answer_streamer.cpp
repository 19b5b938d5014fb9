#include "answer/curl_answer_streamer.hpp"

#include "answer/sse_reader.hpp"
#include "transport/curl_global.hpp"

#include <curl/curl.h>

namespace {

struct TransferState {
    SseReader* reader;
    std::string error_body;
    long status = 0;
    CURL* curl;
    std::stop_token stop;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t len = size * nmemb;

    if (state->status == 0) {
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &state->status);
    }

    // Error responses are plain JSON, keep them for the error detail.
    if (state->status >= 400) {
        state->error_body.append(ptr, len);
        return len;
    }

    // After [DONE] the progress callback ends the transfer.
    state->reader->feed({ptr, len});
    return len;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userdata);
    return state->stop.stop_requested() || state->reader->done() ? 1 : 0;
}

} // namespace

CurlAnswerStreamer::CurlAnswerStreamer(const LiveCodec& codec)
    : codec_(codec), curl_ready_(curl_global::acquire()) {}

CurlAnswerStreamer::~CurlAnswerStreamer() {
    if (curl_ready_) curl_global::release();
}

std::expected<void, SessionError>
CurlAnswerStreamer::stream(const std::string& question, const ChunkCallback& on_chunk,
                           std::stop_token stop) {
    using Kind = SessionError::Kind;

    if (!curl_ready_) {
        return std::unexpected(SessionError{Kind::TransportFailure, "curl unavailable"});
    }

    auto request = codec_.encode_answer_request(question);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(SessionError{Kind::TransportFailure, "curl_easy_init failed"});
    }

    SseReader reader([this, &on_chunk](std::string_view data) {
        if (auto text = codec_.decode_answer_chunk(data)) {
            on_chunk(*text);
        }
        return true;
    });

    TransferState state{.reader = &reader, .error_body = {}, .status = 0,
                        .curl = curl, .stop = stop};

    curl_slist* headers = nullptr;
    for (auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }
    headers = curl_slist_append(headers, "Accept: text/event-stream");

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (state.status == 0) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &state.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (reader.done()) return {};
        return std::unexpected(SessionError{Kind::Cancelled, "answer stream cancelled"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(SessionError{
            Kind::TransportFailure, std::string("curl error: ") + curl_easy_strerror(res)});
    }
    if (state.status >= 400) {
        return std::unexpected(SessionError{
            Kind::ProviderError,
            "HTTP " + std::to_string(state.status) + ": " + state.error_body});
    }

    reader.finish();
    return {};
}
