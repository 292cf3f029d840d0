#include "html/Utf8.hpp"

namespace hwcheck {

// length of the valid sequence starting at i, 0 if invalid
static size_t valid_sequence_length(const std::string& s, size_t i) {
    const unsigned char c = (unsigned char)s[i];
    if (c < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;        // overlong
        if (c == 0xED) hi = 0x9F;        // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;        // > U+10FFFF
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (c1 < lo || c1 > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        const unsigned char ck = (unsigned char)s[i + k];
        if (ck < 0x80 || ck > 0xBF) return 0;
    }
    return len;
}

DecodedText decode_utf8_lossy(const std::string& bytes) {
    DecodedText out;
    out.text.reserve(bytes.size());

    size_t i = 0;
    if (bytes.size() >= 3 &&
        (unsigned char)bytes[0] == 0xEF &&
        (unsigned char)bytes[1] == 0xBB &&
        (unsigned char)bytes[2] == 0xBF) {
        i = 3;
    }

    while (i < bytes.size()) {
        const unsigned char c = (unsigned char)bytes[i];
        if (c == 0) {
            ++out.dropped_bytes;
            ++i;
            continue;
        }
        if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f') || c == 0x7F) {
            ++out.control_bytes;
        }

        const size_t len = valid_sequence_length(bytes, i);
        if (len == 0) {
            ++out.dropped_bytes;
            ++i;
            continue;
        }
        out.text.append(bytes, i, len);
        i += len;
    }

    // binary when over a quarter of the bytes are not text
    out.readable = (out.dropped_bytes + out.control_bytes) * 4 <= bytes.size();
    return out;
}

} // namespace hwcheck
