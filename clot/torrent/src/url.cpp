#include "../include/url.hpp"
#include <cctype>

namespace clot::torrent::detail {

    static inline bool is_scheme_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    }

    static std::string lower(std::string_view s) {
        std::string out(s);
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    UrlParts split_url(std::string_view url)
    {
        UrlParts parts;
        std::string_view rest = url;

        // scheme ":" only when the prefix is a well-formed scheme name
        const size_t colon = url.find(':');
        if (colon != std::string_view::npos && colon > 0
            && std::isalpha(static_cast<unsigned char>(url[0]))) {
            bool ok = true;
            for (char c : url.substr(0, colon)) {
                if (!is_scheme_char(c)) { ok = false; break; }
            }
            if (ok) {
                parts.scheme = lower(url.substr(0, colon));
                rest = url.substr(colon + 1);
            }
        }

        if (rest.substr(0, 2) != "//") return parts;

        // authority = [userinfo "@"] host [":" port], up to path, query or fragment
        std::string_view authority = rest.substr(2);
        const size_t end = authority.find_first_of("/?#");
        if (end != std::string_view::npos) authority = authority.substr(0, end);

        const size_t at = authority.rfind('@');
        if (at != std::string_view::npos) authority = authority.substr(at + 1);

        std::string_view host;
        if (!authority.empty() && authority[0] == '[') {
            const size_t close = authority.find(']');
            host = close == std::string_view::npos ? authority.substr(1) : authority.substr(1, close - 1);
        } else {
            host = authority.substr(0, authority.find(':'));
        }

        parts.host = lower(host);
        return parts;
    }

} // namespace clot::torrent::detail
