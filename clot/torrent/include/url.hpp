#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clot::torrent::detail {

    /**
     * @brief Scheme and host of a URL; everything else is ignored.
     *
     * Examples:
     *  - http://tracker.example.org:6969/announce  -> scheme="http", host="tracker.example.org"
     *  - udp://[2001:db8::1]:80                    -> scheme="udp",  host="2001:db8::1"
     *  - http://:20                                -> scheme="http", host=""
     *  - tracker.example.org                       -> scheme="",     host=nullopt
     */
    struct UrlParts {
        std::string scheme;                     // lower-cased, empty when absent
        std::optional<std::string> host;        // nullopt without an authority part
    };

    UrlParts split_url(std::string_view url);

} // namespace clot::torrent::detail
