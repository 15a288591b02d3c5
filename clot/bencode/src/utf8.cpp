#include "../include/utf8.hpp"
#include <cstdint>

namespace clot::bencode {

    bool is_valid_utf8(std::string_view s) noexcept {
        size_t i = 0;
        const size_t n = s.size();

        while (i < n) {
            const auto c = static_cast<uint8_t>(s[i]);

            if (c < 0x80) { ++i; continue; }

            size_t len = 0;
            uint32_t cp = 0;
            uint32_t min = 0;

            if      ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
            else return false;

            if (n - i < len) return false;

            for (size_t k = 1; k < len; ++k) {
                const auto cc = static_cast<uint8_t>(s[i + k]);
                if ((cc & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            if (cp < min) return false;                         // overlong
            if (cp > 0x10FFFF) return false;
            if (cp >= 0xD800 && cp <= 0xDFFF) return false;     // surrogate

            i += len;
        }
        return true;
    }

}
