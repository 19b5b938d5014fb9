#pragma once

#include "audio_frame.hpp"
#include "config.hpp"
#include "live/live_event.hpp"
#include "transport/transport.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

// Translates between semantic session events and a provider's wire messages.
// Implementations are stateless apart from their configuration.
class LiveCodec {
public:
    virtual ~LiveCodec() = default;

    virtual Endpoint live_endpoint() const = 0;
    // PCM layout the provider expects for audio chunks.
    virtual AudioFormat wire_format() const = 0;
    virtual std::string encode_setup() const = 0;
    virtual std::string encode_audio(std::span<const uint8_t> pcm,
                                     const AudioFormat& format) const = 0;
    virtual HttpRequest encode_answer_request(const std::string& question) const = 0;

    // Never throws; malformed input yields a DecodeFailure event.
    virtual std::vector<LiveEvent> decode(std::string_view raw) const = 0;

    // Text carried by one server-sent event of the answer stream, if any.
    virtual std::optional<std::string> decode_answer_chunk(std::string_view data) const = 0;
};

std::string audio_mime_type(const AudioFormat& format);
std::string answer_prompt(const Config::Provider& provider, const std::string& question);

// Returns nullptr for an unknown provider type.
std::unique_ptr<LiveCodec> make_codec(const Config::Provider& provider);
