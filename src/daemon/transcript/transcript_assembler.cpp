#include "transcript/transcript_assembler.hpp"

#include <algorithm>
#include <cctype>

namespace text_util {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
}

} // namespace text_util

void TurnBuffer::append(std::string_view text) {
    std::lock_guard lock(mutex_);
    text_.append(text);
}

std::string TurnBuffer::drain_and_clear() {
    std::lock_guard lock(mutex_);
    auto out = text_util::trim(text_);
    text_.clear();
    return out;
}

void TurnBuffer::clear() {
    std::lock_guard lock(mutex_);
    text_.clear();
}

std::string TurnBuffer::snapshot() const {
    std::lock_guard lock(mutex_);
    return text_;
}

std::optional<std::string> RollingTranscript::merge(const std::string& next) {
    const std::string& prev = text_;

    if (text_util::iequals(next, prev)) return std::nullopt;

    if (next.starts_with(prev)) {
        auto delta = next.substr(prev.size());
        text_ = next;
        return delta;
    }

    if (prev.starts_with(next)) return std::nullopt;

    // Longest suffix of prev that is a prefix of next.
    size_t max_overlap = std::min(prev.size(), next.size());
    for (size_t k = max_overlap; k >= 1; k--) {
        if (prev.compare(prev.size() - k, k, next, 0, k) == 0) {
            auto delta = next.substr(k);
            if (delta.empty()) return std::nullopt;
            text_ += delta;
            return delta;
        }
    }

    if (prev.find(next) != std::string::npos) return std::nullopt;

    auto delta = "\n" + next;
    text_ += delta;
    return delta;
}

std::optional<std::string> TranscriptAssembler::on_delta(const std::string& text) {
    if (text.empty()) return std::nullopt;

    std::string display = text;
    if (cumulative_) {
        std::lock_guard lock(rolling_mutex_);
        auto merged = rolling_.merge(text);
        if (!merged) return std::nullopt;
        display = std::move(*merged);
    }

    turn_.append(display);
    return display;
}

std::string TranscriptAssembler::on_turn_complete(const std::optional<std::string>& provider_text) {
    auto accumulated = turn_.drain_and_clear();
    if (provider_text && !text_util::is_blank(*provider_text)) {
        return text_util::trim(*provider_text);
    }
    return accumulated;
}

void TranscriptAssembler::reset() {
    turn_.clear();
    std::lock_guard lock(rolling_mutex_);
    rolling_.reset();
}
