#include "live/message_codec.hpp"

#include "live/gemini_codec.hpp"
#include "live/openai_codec.hpp"

#include <format>

std::string audio_mime_type(const AudioFormat& format) {
    return std::format("audio/pcm;rate={}", format.sample_rate);
}

std::string answer_prompt(const Config::Provider& provider, const std::string& question) {
    return provider.answer_prompt + "\n\nQuestion: " + question;
}

std::unique_ptr<LiveCodec> make_codec(const Config::Provider& provider) {
    if (provider.type == "gemini") return std::make_unique<GeminiCodec>(provider);
    if (provider.type == "openai") return std::make_unique<OpenAiCodec>(provider);
    return nullptr;
}
