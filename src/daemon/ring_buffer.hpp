#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer byte ring.
// Producer is the capture thread, consumer the event loop's audio pump.
// Bytes that do not fit are dropped and counted.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_bytes)
        : buf_(capacity_bytes), capacity_(capacity_bytes) {}

    // Producer: returns bytes actually written.
    size_t write(const void* data, size_t len) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(len, avail);
        if (to_write < len) {
            dropped_.fetch_add(len - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        auto src = static_cast<const uint8_t*>(data);
        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, src, first);
        if (first < to_write) {
            std::memcpy(buf_.data(), src + first, to_write - first);
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: returns bytes actually read.
    size_t read(void* dest, size_t max_len) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_len, w - r);
        if (to_read == 0) return 0;

        auto dst = static_cast<uint8_t*>(dest);
        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dst, buf_.data() + offset, first);
        if (first < to_read) {
            std::memcpy(dst + first, buf_.data(), to_read - first);
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: up to max_bytes, rounded down to a multiple of block_align so
    // a sample is never split across two frames.
    std::vector<uint8_t> drain(size_t max_bytes, size_t block_align = 2) {
        if (block_align == 0) block_align = 1;
        size_t n = std::min(max_bytes, available());
        n -= n % block_align;
        if (n == 0) return {};

        std::vector<uint8_t> out(n);
        read(out.data(), n);
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    uint64_t dropped_bytes() const { return dropped_.load(std::memory_order_relaxed); }

    // Only while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<uint8_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<uint64_t> dropped_{0};
};
