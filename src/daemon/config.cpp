#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kKeyPlaceholder = "YOUR_API_KEY_HERE";

} // namespace

std::string Config::Provider::credential() const {
    if (!api_key.empty() && api_key != kKeyPlaceholder) return api_key;

    const char* env = std::getenv(type == "openai" ? "OPENAI_API_KEY" : "GEMINI_API_KEY");
    if (env && *env) return env;
    return {};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("provider")) {
            auto& p = j["provider"];
            auto& out = cfg.provider;
            if (p.contains("type")) out.type = p["type"].get<std::string>();
            if (p.contains("api_key")) out.api_key = p["api_key"].get<std::string>();
            if (p.contains("live_model")) out.live_model = p["live_model"].get<std::string>();
            if (p.contains("answer_model")) out.answer_model = p["answer_model"].get<std::string>();
            if (p.contains("live_url")) out.live_url = p["live_url"].get<std::string>();
            if (p.contains("answer_url")) out.answer_url = p["answer_url"].get<std::string>();
            if (p.contains("system_instruction"))
                out.system_instruction = p["system_instruction"].get<std::string>();
            if (p.contains("answer_prompt")) out.answer_prompt = p["answer_prompt"].get<std::string>();
            if (p.contains("cumulative_transcripts"))
                out.cumulative_transcripts = p["cumulative_transcripts"].get<bool>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            auto& out = cfg.session;
            if (s.contains("setup_timeout_s")) out.setup_timeout_s = s["setup_timeout_s"].get<uint32_t>();
            if (s.contains("max_reconnect_attempts"))
                out.max_reconnect_attempts = s["max_reconnect_attempts"].get<uint32_t>();
            if (s.contains("initial_backoff_s")) out.initial_backoff_s = s["initial_backoff_s"].get<uint32_t>();
            if (s.contains("max_backoff_s")) out.max_backoff_s = s["max_backoff_s"].get<uint32_t>();
            if (s.contains("disconnect_timeout_s"))
                out.disconnect_timeout_s = s["disconnect_timeout_s"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("source")) cfg.audio.source = a["source"].get<std::string>();
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("chunk_ms")) cfg.audio.chunk_ms = a["chunk_ms"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

        if (j.contains("questions")) {
            auto& q = j["questions"];
            if (q.contains("enabled")) cfg.questions.enabled = q["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
