#include "audio_frame.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <print>

namespace pcm16 {

namespace {

std::atomic<bool> warned_unsupported{false};

std::vector<int16_t> downmix(const AudioFrame& frame) {
    uint16_t channels = std::max<uint16_t>(frame.format.channels, 1);
    size_t total = frame.data.size() / sizeof(int16_t);
    size_t frames = total / channels;

    std::vector<int16_t> interleaved(total);
    std::memcpy(interleaved.data(), frame.data.data(), total * sizeof(int16_t));
    if (channels == 1) return interleaved;

    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; i++) {
        int32_t sum = 0;
        for (uint16_t c = 0; c < channels; c++) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

std::vector<int16_t> resample(const std::vector<int16_t>& in, uint32_t from, uint32_t to) {
    if (from == to || in.empty()) return in;

    size_t out_len = static_cast<size_t>(static_cast<uint64_t>(in.size()) * to / from);
    std::vector<int16_t> out(out_len);
    double step = static_cast<double>(from) / to;
    for (size_t i = 0; i < out_len; i++) {
        double pos = i * step;
        size_t idx = static_cast<size_t>(pos);
        double frac = pos - idx;
        int16_t a = in[std::min(idx, in.size() - 1)];
        int16_t b = in[std::min(idx + 1, in.size() - 1)];
        out[i] = static_cast<int16_t>(a + (b - a) * frac);
    }
    return out;
}

} // namespace

std::vector<uint8_t> to_wire(const AudioFrame& frame, uint32_t target_rate) {
    const auto& fmt = frame.format;
    if (fmt.bits_per_sample == 16 && fmt.channels == 1 && fmt.sample_rate == target_rate) {
        return frame.data;
    }

    if (fmt.bits_per_sample != 16 || fmt.sample_rate == 0) {
        if (!warned_unsupported.exchange(true)) {
            std::println(stderr, "audio: unsupported format {} Hz/{} bit/{} ch, sending as-is",
                         fmt.sample_rate, fmt.bits_per_sample, fmt.channels);
        }
        return frame.data;
    }

    auto samples = resample(downmix(frame), fmt.sample_rate, target_rate);
    std::vector<uint8_t> out(samples.size() * sizeof(int16_t));
    std::memcpy(out.data(), samples.data(), out.size());
    return out;
}

} // namespace pcm16
