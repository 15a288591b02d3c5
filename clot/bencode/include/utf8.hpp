#pragma once
#include <string_view>

namespace clot::bencode {

    /**
     * @brief Strict UTF-8 check: rejects overlong forms, surrogates and
     * code points above U+10FFFF.
     */
    bool is_valid_utf8(std::string_view s) noexcept;

}
