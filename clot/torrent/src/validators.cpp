#include "../include/validators.hpp"
#include "../include/text_codec.hpp"
#include "../include/url.hpp"
#include "../../bencode/include/utf8.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace clot::torrent {

    const char* to_string(UrlDefect d) noexcept {
        switch (d) {
            case UrlDefect::missing_scheme:    return "missing scheme";
            case UrlDefect::unexpected_scheme: return "unexpected scheme";
            case UrlDefect::missing_hostname:  return "missing hostname";
        }
        return "ill-formed";
    }

} // namespace clot::torrent


namespace clot::torrent::validators {

    using bencode::BencodeValue;

    [[noreturn]] static void type_mismatch(const std::string& name, const BencodeValue& raw, const char* expected) {
        throw TypeError(name + ": expected " + raw.toString() + " to be of type " + expected);
    }

    static bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    static std::string text_repr(const std::string& s) {
        return BencodeValue::text(s).toString();
    }

    static void log_encoding(TextContext& ctx, logger::LogLevel lvl, const std::string& field,
                             const std::string& encoding, std::string msg) {
        auto* lg = ctx.log();
        if (!lg || !CLOT_LOG_ENABLED(lvl)) return;

        logger::LogRecord rec;
        rec.level = lvl;
        rec.logger = "text";
        rec.msg = std::move(msg);
        rec.field = field;
        rec.encoding = encoding;
        lg->log(std::move(rec));
    }


    // ---------- Typed ----------

    const bencode::Integer& expect_int(const std::string& name, const BencodeValue& raw) {
        if (!raw.isInt()) type_mismatch(name, raw, "int");
        return raw.asInt();
    }

    const std::string& expect_bytes(const std::string& name, const BencodeValue& raw) {
        if (!raw.isString()) type_mismatch(name, raw, "bytes");
        return raw.asString();
    }

    const BencodeValue::List& expect_list(const std::string& name, const BencodeValue& raw) {
        if (!raw.isList()) type_mismatch(name, raw, "list");
        return raw.asList();
    }

    const bencode::Dict& expect_dict(const std::string& name, const BencodeValue& raw) {
        if (!raw.isDict()) type_mismatch(name, raw, "dict");
        return raw.asDict();
    }


    // ---------- Bounded ----------

    Check<bencode::Integer> bounded(std::optional<bencode::Integer> min, std::optional<bencode::Integer> max) {
        return [min, max](const std::string& name, const bencode::Integer& v) {
            if (min && v < *min) {
                throw RangeError(name + ": expected " + v.toString() + " to be at least " + min->toString());
            }
            if (max && v > *max) {
                throw RangeError(name + ": expected " + v.toString() + " to be at most " + max->toString());
            }
        };
    }


    // ---------- NonEmpty ----------

    bool is_blank(const std::string& s) noexcept {
        return std::all_of(s.begin(), s.end(), [](char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        });
    }

    Check<std::string> non_empty() {
        return [](const std::string& name, const std::string& v) {
            if (is_blank(v)) throw EmptyValueError(name + ": empty value is not allowed");
        };
    }


    Check<std::string> utf8_text() {
        return [](const std::string& name, const std::string& v) {
            if (!bencode::is_valid_utf8(v)) throw ValueError(name + ": the value " + BencodeValue(v).toString() + " is not UTF-8 text");
        };
    }


    // ---------- Encoded ----------

    std::vector<std::string> candidate_encodings(const std::optional<std::string>& explicitEncoding,
                                                 TextContext& ctx) {
        if (explicitEncoding) return {*explicitEncoding};

        std::vector<std::string> out;
        auto push = [&out](const std::string& enc) {
            for (const auto& seen : out) {
                if (same_encoding(seen, enc)) return;
            }
            out.push_back(enc);
        };

        if (auto rec = ctx.recordEncoding(); rec && !is_utf8_name(*rec)) push(*rec);
        push("UTF-8");
        if (const auto& fb = ctx.fallbackEncoding()) push(*fb);
        return out;
    }

    std::string decode_encoded(const std::string& name, const std::string& raw,
                               const std::optional<std::string>& explicitEncoding, TextContext& ctx) {

        const auto candidates = candidate_encodings(explicitEncoding, ctx);

        for (const auto& enc : candidates) {
            auto text = decode_text(raw, enc);
            if (text.has_value()) {
                if (!is_utf8_name(enc)) {
                    log_encoding(ctx, logger::LogLevel::debug, name, enc, "decoded as " + enc);
                }
                return std::move(text.get());
            }
            const auto& why = text.error->message;
            if (!is_known_encoding(enc)) {
                log_encoding(ctx, logger::LogLevel::warn, name, enc, why);
            } else {
                log_encoding(ctx, logger::LogLevel::debug, name, enc, "not " + enc + ": " + why);
            }
        }

        std::string names;
        for (const auto& enc : candidates) {
            if (!names.empty()) names += ", ";
            names += enc;
        }
        throw TextDecodeError(name + ": cannot decode " + BencodeValue(raw).toString() + " as " + names, candidates);
    }


    // ---------- UnixEpoch ----------

    [[noreturn]] static void not_a_timestamp(const std::string& name, const std::string& seconds) {
        throw ConversionError(name + ": cannot convert " + seconds + " to a timestamp");
    }

    Timestamp from_unix_epoch(const std::string& name, const bencode::Integer& seconds) {
        if (!seconds.fitsInt64() || seconds.asInt64() < kMinEpoch || seconds.asInt64() > kMaxEpoch) {
            not_a_timestamp(name, seconds.toString());
        }
        return Timestamp::fromUnix(seconds.asInt64());
    }

    Check<Timestamp> timezone_aware() {
        return [](const std::string& name, const Timestamp& t) {
            if (!t.hasOffset()) {
                throw MissingTimezoneError(name + ": the value " + t.isoformat() + " is missing timezone info");
            }
        };
    }

    Check<Timestamp> within_epoch() {
        return [](const std::string& name, const Timestamp& t) {
            const int64_t seconds = t.toUnix();
            if (seconds < kMinEpoch || seconds > kMaxEpoch) not_a_timestamp(name, std::to_string(seconds));
        };
    }


    // ---------- ValidUrl ----------

    std::vector<std::string> default_url_schemes() {
        return {"https", "http", "udp"};
    }

    void check_url(const std::string& name, const std::string& value, const std::vector<std::string>& schemes) {

        const auto parts = detail::split_url(value);

        auto fail = [&](UrlDefect d) {
            throw IllFormedUrlError(name + ": the value " + text_repr(value) + " is ill-formed (" + to_string(d) + ")", d);
        };

        if (parts.scheme.empty()) fail(UrlDefect::missing_scheme);

        const bool allowed = std::any_of(schemes.begin(), schemes.end(),
                                         [&](const std::string& s) { return iequals(s, parts.scheme); });
        if (!allowed) fail(UrlDefect::unexpected_scheme);

        if (!parts.host || parts.host->empty()) fail(UrlDefect::missing_hostname);
    }

    Check<std::string> valid_url(std::vector<std::string> schemes) {
        return [schemes = std::move(schemes)](const std::string& name, const std::string& v) {
            check_url(name, v, schemes);
        };
    }


    // ---------- ValidNode ----------

    static bool parse_port(std::string_view s, uint16_t& out) {
        if (s.empty() || s.size() > 5 || s[0] == '0') return false;
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size() || value < 1 || value > 65535) return false;
        out = static_cast<uint16_t>(value);
        return true;
    }

    std::string node_from_pair(const std::string& name, const BencodeValue& item) {
        if (item.isList() && item.asList().size() == 2) {
            const auto& host = item.asList()[0];
            const auto& port = item.asList()[1];
            if (host.isString() && port.isInt()
                && !is_blank(host.asString()) && bencode::is_valid_utf8(host.asString())
                && !port.asInt().negative() && port.asInt().magnitude() >= 1 && port.asInt().magnitude() <= 65535) {
                return host.asString() + ":" + port.asInt().toString();
            }
        }
        throw InvalidNodeError(name + ": invalid node " + item.toString());
    }

    std::string check_node(const std::string& name, const std::string& node) {
        const size_t colon = node.rfind(':');
        uint16_t port = 0;
        if (colon != std::string::npos && !is_blank(node.substr(0, colon))
            && parse_port(std::string_view(node).substr(colon + 1), port)) {
            return node;
        }
        throw InvalidNodeError(name + ": invalid node " + text_repr(node));
    }

    BencodeValue node_to_pair(const std::string& node) {
        const size_t colon = node.rfind(':');
        uint16_t port = 0;
        if (colon == std::string::npos || !parse_port(std::string_view(node).substr(colon + 1), port)) {
            throw InvalidNodeError("invalid node " + text_repr(node));
        }
        return BencodeValue::List{BencodeValue(node.substr(0, colon)), BencodeValue(port)};
    }


    // ---------- ValidTier ----------

    static std::string tier_repr(const Tier& tier) {
        BencodeValue::List items(tier.begin(), tier.end());
        return BencodeValue(std::move(items)).toString();
    }

    Tier tier_from_list(const std::string& name, const BencodeValue& item) {
        Tier tier;
        if (item.isList()) {
            for (const auto& url : item.asList()) {
                if (!url.isString()) throw ValueError(name + ": invalid tier " + item.toString());
                tier.push_back(url.asString());
            }
            return check_tier(name, tier);
        }
        throw ValueError(name + ": invalid tier " + item.toString());
    }

    Tier check_tier(const std::string& name, const Tier& tier) {
        if (tier.empty() || std::any_of(tier.begin(), tier.end(), [](const std::string& u) { return is_blank(u); })) {
            throw ValueError(name + ": invalid tier " + tier_repr(tier));
        }
        return tier;
    }

} // namespace clot::torrent::validators
