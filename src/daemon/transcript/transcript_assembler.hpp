#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Text accumulated for the current turn. Appends and drains are serialized so
// a turn boundary never races an in-flight append from the same turn.
class TurnBuffer {
public:
    void append(std::string_view text);
    // Returns the trimmed contents and empties the buffer.
    std::string drain_and_clear();
    void clear();
    std::string snapshot() const;

private:
    mutable std::mutex mutex_;
    std::string text_;
};

// The longest transcript shown so far, for providers that resend growing
// cumulative text. The running text only ever grows.
class RollingTranscript {
public:
    // Returns the part of `next` not already represented, or std::nullopt.
    std::optional<std::string> merge(const std::string& next);

    const std::string& text() const { return text_; }
    void reset() { text_.clear(); }

private:
    std::string text_;
};

class TranscriptAssembler {
public:
    explicit TranscriptAssembler(bool cumulative = false) : cumulative_(cumulative) {}

    // Text to display for a transcription fragment, or std::nullopt when it
    // carries nothing new. The returned text is appended to the current turn.
    std::optional<std::string> on_delta(const std::string& text);

    // Finalized turn text. A non-blank provider transcript takes precedence
    // over the accumulated buffer. Blank turns come back as an empty string.
    std::string on_turn_complete(const std::optional<std::string>& provider_text = std::nullopt);

    // Drops a partially accumulated turn (new connection).
    void discard_turn() { turn_.clear(); }

    // Start of a session.
    void reset();

    std::string current_turn() const { return turn_.snapshot(); }
    bool cumulative() const { return cumulative_; }

private:
    bool cumulative_;
    TurnBuffer turn_;
    std::mutex rolling_mutex_;
    RollingTranscript rolling_;
};

namespace text_util {

std::string trim(std::string_view s);
bool is_blank(std::string_view s);
std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);

} // namespace text_util
