#pragma once

#include "platform/frame_source.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireCapture : public FrameSource {
public:
    enum class Source { System, Microphone };

    PipeWireCapture(Source source, uint32_t sample_rate, size_t buffer_bytes);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    AudioFormat format() const override { return format_; }
    std::optional<AudioFrame> next_frame(size_t max_bytes) override;
    uint64_t dropped_bytes() const override { return ring_buf_.dropped_bytes(); }

    // "system" selects the sink monitor; anything else the default input.
    static Source parse_source(const std::string& name);

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    Source source_;
    AudioFormat format_;
    RingBuffer ring_buf_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
