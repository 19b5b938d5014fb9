#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <thread>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<uint8_t> data(64);
        std::iota(data.begin(), data.end(), uint8_t(0));

        REQUIRE(rb.write(data.data(), data.size()) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<uint8_t> out(64);
        REQUIRE(rb.read(out.data(), out.size()) == 64);
        REQUIRE(out == data);
        REQUIRE(rb.available() == 0);
    }

    SECTION("DrainAcrossWrapBoundary") {
        std::vector<uint8_t> fill(200, 0xEE);
        REQUIRE(rb.write(fill.data(), fill.size()) == 200);
        REQUIRE(rb.drain(200).size() == 200);

        // write_pos is at 200, so 128 bytes wrap past the end.
        std::vector<uint8_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), uint8_t(42));
        REQUIRE(rb.write(wrap.data(), wrap.size()) == 128);
        REQUIRE(rb.drain(cap) == wrap);
    }

    SECTION("OverrunCountsDroppedBytes") {
        std::vector<uint8_t> big(cap + 100, 0xAB);

        REQUIRE(rb.write(big.data(), big.size()) == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.dropped_bytes() == 100);

        REQUIRE(rb.write(big.data(), 10) == 0);
        REQUIRE(rb.dropped_bytes() == 110);
    }

    SECTION("DrainRespectsMaxBytes") {
        std::vector<uint8_t> data(100, 0x01);
        rb.write(data.data(), data.size());

        REQUIRE(rb.drain(64).size() == 64);
        REQUIRE(rb.available() == 36);
        REQUIRE(rb.drain(64).size() == 36);
        REQUIRE(rb.drain(64).empty());
    }

    SECTION("DrainKeepsSamplesWhole") {
        std::vector<uint8_t> odd(7, 0x01);
        rb.write(odd.data(), odd.size());

        REQUIRE(rb.drain(cap).size() == 6);
        REQUIRE(rb.available() == 1);

        // Stereo 16-bit frames are four bytes.
        std::vector<uint8_t> more(9, 0x02);
        rb.write(more.data(), more.size());
        REQUIRE(rb.drain(cap, 4).size() == 8);
        REQUIRE(rb.available() == 2);
        REQUIRE(rb.drain(cap, 4).empty());
    }

    SECTION("ResetClearsState") {
        std::vector<uint8_t> data(cap + 1, 0xFF);
        rb.write(data.data(), data.size());
        REQUIRE(rb.dropped_bytes() == 1);

        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE(rb.dropped_bytes() == 0);
    }

    SECTION("ProducerConsumerThreads") {
        constexpr size_t total = 64 * 1024;
        std::vector<uint8_t> received;
        received.reserve(total);

        std::jthread producer([&rb] {
            size_t sent = 0;
            while (sent < total) {
                uint8_t chunk[32];
                size_t n = std::min(sizeof(chunk), total - sent);
                for (size_t i = 0; i < n; i++) chunk[i] = static_cast<uint8_t>((sent + i) & 0xFF);
                sent += rb.write(chunk, n);
                if (sent < total) std::this_thread::yield();
            }
        });

        while (received.size() < total) {
            auto part = rb.drain(64, 1);
            received.insert(received.end(), part.begin(), part.end());
            if (part.empty()) std::this_thread::yield();
        }
        producer.join();

        bool ordered = true;
        for (size_t i = 0; i < total; i++) {
            if (received[i] != static_cast<uint8_t>(i & 0xFF)) { ordered = false; break; }
        }
        REQUIRE(ordered);
    }
}
