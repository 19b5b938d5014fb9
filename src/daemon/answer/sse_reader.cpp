#include "answer/sse_reader.hpp"

bool SseReader::feed(std::string_view bytes) {
    if (done_) return false;
    pending_.append(bytes);

    size_t start = 0;
    size_t pos;
    while ((pos = pending_.find('\n', start)) != std::string::npos) {
        std::string_view line(pending_.data() + start, pos - start);
        start = pos + 1;
        if (!handle_line(line)) {
            done_ = true;
            break;
        }
    }
    pending_.erase(0, start);
    if (done_) pending_.clear();
    return !done_;
}

bool SseReader::finish() {
    if (done_ || pending_.empty()) return !done_;
    std::string line = std::move(pending_);
    pending_.clear();
    if (!handle_line(line)) done_ = true;
    return !done_;
}

bool SseReader::handle_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    constexpr std::string_view prefix = "data:";
    if (!line.starts_with(prefix)) return true;

    auto data = line.substr(prefix.size());
    if (data.starts_with(' ')) data.remove_prefix(1);
    if (data.empty()) return true;
    if (data == "[DONE]") return false;

    return on_data_(data);
}
