#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "expected.hpp"


namespace clot::torrent {

    /**
     * @brief Decode bytes in the named character set to UTF-8 text.
     * Fails when the bytes are not valid in that character set or when the
     * platform does not know the character set (see is_known_encoding).
     */
    Expected<std::string> decode_text(std::string_view bytes, const std::string& encoding);

    bool is_known_encoding(const std::string& encoding);

    // "utf-8", "UTF8" and "utf_8" name the same character set.
    bool same_encoding(std::string_view a, std::string_view b);

    inline bool is_utf8_name(std::string_view encoding) { return same_encoding(encoding, "UTF-8"); }

    // Windows code page number to a character set name: 65001 is UTF-8, n is CP<n>.
    std::string codepage_encoding(uint64_t codepage);

} // namespace clot::torrent
