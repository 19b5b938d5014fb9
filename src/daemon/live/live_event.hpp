#pragma once

#include <optional>
#include <string>
#include <variant>

// Semantic events decoded from provider messages.
namespace live_event {

struct SetupComplete {};

struct TranscriptDelta {
    std::string text;
};

struct ModelOutput {
    std::string text;
};

// Some providers send the full turn transcript with the boundary marker.
struct TurnComplete {
    std::optional<std::string> text;
};

struct ProviderError {
    std::string detail;
};

struct Unrecognized {
    std::string raw;
};

struct DecodeFailure {
    std::string raw;
    std::string reason;
};

} // namespace live_event

using LiveEvent = std::variant<live_event::SetupComplete,
                               live_event::TranscriptDelta,
                               live_event::ModelOutput,
                               live_event::TurnComplete,
                               live_event::ProviderError,
                               live_event::Unrecognized,
                               live_event::DecodeFailure>;
