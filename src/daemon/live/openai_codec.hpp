#pragma once

#include "live/message_codec.hpp"

// OpenAI Realtime wire format (transcription session, text modality).
class OpenAiCodec : public LiveCodec {
public:
    explicit OpenAiCodec(Config::Provider provider);

    Endpoint live_endpoint() const override;
    AudioFormat wire_format() const override { return {.sample_rate = 24000}; }
    std::string encode_setup() const override;
    std::string encode_audio(std::span<const uint8_t> pcm,
                             const AudioFormat& format) const override;
    HttpRequest encode_answer_request(const std::string& question) const override;

    std::vector<LiveEvent> decode(std::string_view raw) const override;
    std::optional<std::string> decode_answer_chunk(std::string_view data) const override;

private:
    Config::Provider provider_;
    std::string key_;
};
