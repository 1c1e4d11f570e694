#pragma once

#include <cstddef>
#include <string_view>


namespace wheelbuf::detail {

inline constexpr char32_t replacement_character = U'\uFFFD';

// Decodes UTF-8 into code points, handing each one to `sink` in order.
// Truncated, overlong, surrogate and out-of-range sequences decode to
// U+FFFD; the lead byte and any continuation bytes already examined are
// consumed, so decoding always makes progress.
template <class Sink>
constexpr void decode_utf8(std::string_view in, Sink&& sink) {
    const std::size_t n = in.size();
    std::size_t i = 0;

    while (i < n) {
        const auto lead = static_cast<unsigned char>(in[i]);
        if (lead < 0x80) {
            sink(static_cast<char32_t>(lead));
            ++i;
            continue;
        }

        std::size_t len;
        char32_t cp;
        char32_t min;
        if ((lead & 0xE0) == 0xC0)      { len = 2; cp = lead & 0x1F; min = 0x80; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min = 0x800; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min = 0x10000; }
        else {
            // stray continuation byte or invalid lead
            sink(replacement_character);
            ++i;
            continue;
        }

        std::size_t k = 1;
        for (; k < len && i + k < n; ++k) {
            const auto b = static_cast<unsigned char>(in[i + k]);
            if ((b & 0xC0) != 0x80) break;
            cp = (cp << 6) | (b & 0x3F);
        }

        if (k != len || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            sink(replacement_character);
            i += k;
            continue;
        }

        sink(cp);
        i += len;
    }
}

} // namespace wheelbuf::detail
