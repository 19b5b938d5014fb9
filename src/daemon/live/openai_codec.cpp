#include "live/openai_codec.hpp"

#include "live/base64.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* kLiveUrl = "wss://api.openai.com/v1/realtime";
constexpr const char* kAnswerUrl = "https://api.openai.com/v1/responses";
constexpr const char* kLiveModel = "gpt-4o-realtime-preview";
constexpr const char* kTranscriptionModel = "gpt-4o-mini-transcribe";
constexpr const char* kAnswerModel = "gpt-4o-mini";
constexpr const char* kInstructions =
    "Provide verbatim transcription of the user audio. Do not answer or summarize.";

} // namespace

OpenAiCodec::OpenAiCodec(Config::Provider provider)
    : provider_(std::move(provider)), key_(provider_.credential()) {}

Endpoint OpenAiCodec::live_endpoint() const {
    std::string base = provider_.live_url.empty() ? kLiveUrl : provider_.live_url;
    std::string model = provider_.live_model.empty() ? kLiveModel : provider_.live_model;
    return Endpoint{
        .url = base + "?model=" + model,
        .headers = {"Authorization: Bearer " + key_, "OpenAI-Beta: realtime=v1"},
    };
}

std::string OpenAiCodec::encode_setup() const {
    json msg = {
        {"type", "session.update"},
        {"session", {
            {"modalities", {"text"}},
            {"instructions", provider_.system_instruction.empty()
                ? kInstructions : provider_.system_instruction},
            {"input_audio_format", "pcm16"},
            {"input_audio_transcription", {{"model", kTranscriptionModel}}},
            {"turn_detection", {{"type", "server_vad"}}},
        }},
    };
    return msg.dump();
}

// The realtime API takes the format from the session; the descriptor only
// matters to providers that tag each chunk.
std::string OpenAiCodec::encode_audio(std::span<const uint8_t> pcm,
                                      const AudioFormat& /*format*/) const {
    json msg = {
        {"type", "input_audio_buffer.append"},
        {"audio", base64::encode(pcm)},
    };
    return msg.dump();
}

HttpRequest OpenAiCodec::encode_answer_request(const std::string& question) const {
    json body = {
        {"model", provider_.answer_model.empty() ? kAnswerModel : provider_.answer_model},
        {"input", answer_prompt(provider_, question)},
        {"stream", true},
    };

    return HttpRequest{
        .url = provider_.answer_url.empty() ? kAnswerUrl : provider_.answer_url,
        .headers = {"Content-Type: application/json", "Authorization: Bearer " + key_},
        .body = body.dump(),
    };
}

std::vector<LiveEvent> OpenAiCodec::decode(std::string_view raw) const {
    std::vector<LiveEvent> events;

    try {
        auto j = json::parse(raw);
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            events.push_back(live_event::Unrecognized{std::string(raw)});
            return events;
        }

        auto type = j["type"].get<std::string>();

        if (type == "session.created" || type == "session.updated") {
            events.push_back(live_event::SetupComplete{});
        } else if (type == "error") {
            std::string detail = j.contains("error") ? j["error"].dump() : std::string(raw);
            events.push_back(live_event::ProviderError{std::move(detail)});
        } else if (type == "conversation.item.input_audio_transcription.delta") {
            auto text = j.value("delta", "");
            if (!text.empty()) events.push_back(live_event::TranscriptDelta{std::move(text)});
        } else if (type == "conversation.item.input_audio_transcription.completed") {
            live_event::TurnComplete done;
            auto transcript = j.value("transcript", "");
            if (!transcript.empty()) done.text = std::move(transcript);
            events.push_back(std::move(done));
        } else if (type == "response.text.delta") {
            auto text = j.value("delta", "");
            if (!text.empty()) events.push_back(live_event::ModelOutput{std::move(text)});
        } else {
            events.push_back(live_event::Unrecognized{std::string(raw)});
        }
    } catch (const json::exception& e) {
        events.clear();
        events.push_back(live_event::DecodeFailure{std::string(raw), e.what()});
    }

    return events;
}

std::optional<std::string> OpenAiCodec::decode_answer_chunk(std::string_view data) const {
    try {
        auto j = json::parse(data);
        if (j.value("type", "") != "response.output_text.delta") return std::nullopt;

        auto delta = j.value("delta", "");
        if (delta.empty()) return std::nullopt;
        return delta;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
