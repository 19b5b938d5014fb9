#pragma once

#include "live/session_error.hpp"

#include <expected>
#include <functional>
#include <stop_token>
#include <string>

// One-shot streamed answer for a question, independent of the live session.
class AnswerStreamer {
public:
    using ChunkCallback = std::function<void(const std::string& chunk)>;

    virtual ~AnswerStreamer() = default;

    // Blocks until the stream ends, fails, or `stop` is requested.
    virtual std::expected<void, SessionError>
        stream(const std::string& question, const ChunkCallback& on_chunk,
               std::stop_token stop) = 0;
};
