#pragma once

#include <functional>
#include <string>
#include <string_view>

// Splits a server-sent-events body into `data:` payloads. Input may arrive in
// arbitrary pieces; payloads are delivered once their line is complete.
class SseReader {
public:
    // Return false from the callback to stop reading.
    using DataCallback = std::function<bool(std::string_view data)>;

    explicit SseReader(DataCallback on_data) : on_data_(std::move(on_data)) {}

    // Returns false once the stream is finished ([DONE] or callback refusal).
    bool feed(std::string_view bytes);
    // Flushes a trailing line without newline.
    bool finish();

    bool done() const { return done_; }

private:
    bool handle_line(std::string_view line);

    DataCallback on_data_;
    std::string pending_;
    bool done_ = false;
};
