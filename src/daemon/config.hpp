#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Provider {
        std::string type = "gemini"; // "gemini" or "openai"
        std::string api_key;
        std::string live_model;      // empty: provider default
        std::string answer_model;    // empty: provider default
        std::string live_url;        // empty: provider default
        std::string answer_url;      // empty: provider default
        std::string system_instruction;
        std::string answer_prompt = "Answer this question briefly and directly:";
        // Provider resends the growing transcript instead of fragments.
        bool cumulative_transcripts = false;

        // api_key, or the provider's environment variable when the key is
        // unset or still the template placeholder. Empty if neither is set.
        std::string credential() const;
    } provider;

    struct Session {
        uint32_t setup_timeout_s = 10;
        uint32_t max_reconnect_attempts = 5;
        uint32_t initial_backoff_s = 2;
        uint32_t max_backoff_s = 30;
        uint32_t disconnect_timeout_s = 2;
    } session;

    struct Audio {
        std::string source = "system"; // "system" (sink monitor) or "microphone"
        uint32_t sample_rate = 16000;
        uint32_t chunk_ms = 100;
        uint32_t max_seconds = 10;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Questions {
        bool enabled = true;
    } questions;

    static Config load(const std::string& path);
    static Config load_default();
};
