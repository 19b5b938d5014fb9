#pragma once

#include <cstdint>
#include <vector>

struct AudioFormat {
    uint32_t sample_rate = 16000;
    uint16_t bits_per_sample = 16;
    uint16_t channels = 1;

    uint32_t block_align() const { return channels * bits_per_sample / 8; }

    bool operator==(const AudioFormat&) const = default;
};

struct AudioFrame {
    std::vector<uint8_t> data;
    AudioFormat format;
};

namespace pcm16 {

// Converts a frame to mono S16LE at target_rate. Frames already in that
// format pass through untouched. Unsupported bit depths come back unchanged.
std::vector<uint8_t> to_wire(const AudioFrame& frame, uint32_t target_rate = 16000);

} // namespace pcm16
