#pragma once

#include "audio_frame.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

// Supplier of captured PCM frames. Capture runs on its own thread; frames are
// pulled by the consumer.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    virtual AudioFormat format() const = 0;

    // Everything buffered since the last call, up to max_bytes, or
    // std::nullopt when nothing is buffered.
    virtual std::optional<AudioFrame> next_frame(size_t max_bytes) = 0;

    // Bytes lost because the consumer fell behind.
    virtual uint64_t dropped_bytes() const = 0;
};
