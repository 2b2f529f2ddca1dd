#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hmmdc {

// Decode bytes as UTF-8, replacing every invalid or truncated sequence
// with U+FFFD. Never fails. Valid input is returned unchanged.
inline std::string sanitize_utf8(const uint8_t* data, size_t n) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(n);

    size_t i = 0;
    while (i < n) {
        uint8_t c = data[i];
        size_t len = 0;
        uint32_t min_cp = 0;
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; min_cp = 0x10000;
        }

        bool ok = len > 0 && i + len <= n;
        uint32_t cp = ok ? (c & (0xFF >> (len + 1))) : 0;
        for (size_t k = 1; ok && k < len; k++) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (cc & 0x3F);
            }
        }
        if (ok && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            ok = false;
        }

        if (ok) {
            out.append(reinterpret_cast<const char*>(data + i), len);
            i += len;
        } else {
            out.append(kReplacement);
            i++;
        }
    }
    return out;
}

// Number of code points in a valid UTF-8 string.
inline size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

} // namespace hmmdc
