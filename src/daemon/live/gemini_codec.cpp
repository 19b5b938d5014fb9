#include "live/gemini_codec.hpp"

#include "live/base64.hpp"
#include "transcript/transcript_assembler.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* kLiveUrl =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1alpha.GenerativeService.BidiGenerateContent";
constexpr const char* kApiBase = "https://generativelanguage.googleapis.com/v1/models/";
constexpr const char* kLiveModel = "models/gemini-2.5-flash-native-audio-preview-12-2025";
constexpr const char* kAnswerModel = "gemini-2.5-flash";
constexpr const char* kSystemInstruction = "Listen to the user and do not speak";

} // namespace

GeminiCodec::GeminiCodec(Config::Provider provider)
    : provider_(std::move(provider)), key_(provider_.credential()) {}

Endpoint GeminiCodec::live_endpoint() const {
    std::string base = provider_.live_url.empty() ? kLiveUrl : provider_.live_url;
    return Endpoint{.url = base + "?key=" + key_, .headers = {}};
}

std::string GeminiCodec::encode_setup() const {
    std::string instruction = provider_.system_instruction.empty()
        ? kSystemInstruction : provider_.system_instruction;

    json setup = {
        {"setup", {
            {"model", provider_.live_model.empty() ? kLiveModel : provider_.live_model},
            {"generationConfig", {{"responseModalities", {"AUDIO"}}}},
            {"inputAudioTranscription", json::object()},
            {"systemInstruction", {{"parts", {{{"text", instruction}}}}}},
        }},
    };
    return setup.dump();
}

std::string GeminiCodec::encode_audio(std::span<const uint8_t> pcm,
                                      const AudioFormat& format) const {
    json msg = {
        {"realtimeInput", {
            {"mediaChunks", {{
                {"mimeType", audio_mime_type(format)},
                {"data", base64::encode(pcm)},
            }}},
        }},
    };
    return msg.dump();
}

HttpRequest GeminiCodec::encode_answer_request(const std::string& question) const {
    std::string url = provider_.answer_url;
    if (url.empty()) {
        std::string model = provider_.answer_model.empty() ? kAnswerModel : provider_.answer_model;
        url = kApiBase + model + ":streamGenerateContent?alt=sse";
    }
    url += (url.find('?') == std::string::npos ? "?key=" : "&key=") + key_;

    json body = {
        {"contents", {{
            {"parts", {{{"text", answer_prompt(provider_, question)}}}},
        }}},
    };

    return HttpRequest{
        .url = std::move(url),
        .headers = {"Content-Type: application/json"},
        .body = body.dump(),
    };
}

std::vector<LiveEvent> GeminiCodec::decode(std::string_view raw) const {
    std::vector<LiveEvent> events;

    try {
        auto j = json::parse(raw);
        if (!j.is_object()) {
            events.push_back(live_event::DecodeFailure{std::string(raw), "not a JSON object"});
            return events;
        }

        if (j.contains("setupComplete")) {
            events.push_back(live_event::SetupComplete{});
        }

        if (j.contains("serverContent")) {
            auto& content = j["serverContent"];

            if (content.contains("inputTranscription")) {
                auto text = content["inputTranscription"].value("text", "");
                if (!text_util::is_blank(text)) {
                    events.push_back(live_event::TranscriptDelta{std::move(text)});
                }
            }

            if (content.contains("modelTurn") && content["modelTurn"].contains("parts")) {
                for (auto& part : content["modelTurn"]["parts"]) {
                    auto text = part.value("text", "");
                    if (!text.empty()) {
                        events.push_back(live_event::ModelOutput{std::move(text)});
                    }
                }
            }

            if (content.value("turnComplete", false)) {
                events.push_back(live_event::TurnComplete{});
            }
        }

        if (j.contains("error")) {
            events.push_back(live_event::ProviderError{j["error"].dump()});
        }

        if (events.empty() && !j.contains("serverContent")) {
            events.push_back(live_event::Unrecognized{std::string(raw)});
        }
    } catch (const json::exception& e) {
        events.clear();
        events.push_back(live_event::DecodeFailure{std::string(raw), e.what()});
    }

    return events;
}

std::optional<std::string> GeminiCodec::decode_answer_chunk(std::string_view data) const {
    try {
        auto j = json::parse(data);
        if (!j.contains("candidates") || j["candidates"].empty()) return std::nullopt;

        auto& candidate = j["candidates"][0];
        if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
            return std::nullopt;
        }

        auto& parts = candidate["content"]["parts"];
        if (parts.empty()) return std::nullopt;

        auto text = parts[0].value("text", "");
        if (text.empty()) return std::nullopt;
        return text;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
