#pragma once

#include "answer/answer_streamer.hpp"
#include "live/message_codec.hpp"

class CurlAnswerStreamer : public AnswerStreamer {
public:
    explicit CurlAnswerStreamer(const LiveCodec& codec);
    ~CurlAnswerStreamer() override;

    CurlAnswerStreamer(const CurlAnswerStreamer&) = delete;
    CurlAnswerStreamer& operator=(const CurlAnswerStreamer&) = delete;

    std::expected<void, SessionError>
        stream(const std::string& question, const ChunkCallback& on_chunk,
               std::stop_token stop) override;

private:
    const LiveCodec& codec_;
    bool curl_ready_;
};
