#pragma once
#include <string>

namespace hwcheck {

struct DecodedText {
    std::string text;          // valid UTF-8 only
    size_t dropped_bytes = 0;  // NULs and bytes that were not part of a valid sequence
    size_t control_bytes = 0;  // kept C0 controls other than tab, LF, CR, FF, plus DEL
    bool readable = true;
};

// Lossy UTF-8 decode: strips a leading BOM, drops NULs and invalid sequences byte by byte.
// Marks the input unreadable when more than a quarter of it is dropped or control bytes.
DecodedText decode_utf8_lossy(const std::string& bytes);

} // namespace hwcheck
