#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace base64 {

inline std::string encode(std::span<const uint8_t> data) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += table[(triple >> 18) & 0x3F];
        out += table[(triple >> 12) & 0x3F];
        out += table[(triple >> 6) & 0x3F];
        out += table[triple & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = uint32_t(data[i]) << 16;
        out += table[(triple >> 18) & 0x3F];
        out += table[(triple >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += table[(triple >> 18) & 0x3F];
        out += table[(triple >> 12) & 0x3F];
        out += table[(triple >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

} // namespace base64
