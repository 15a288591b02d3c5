#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../../bencode/include/bencode.hpp"
#include "../../logger/logger.hpp"
#include "errors.hpp"
#include "values.hpp"


namespace clot::torrent {

    /**
     * @brief Record-wide inputs of text decoding, provided by the record that
     * owns the fields.
     */
    class TextContext
    {
    public:
        virtual ~TextContext() = default;

        // Character set declared by the record itself (an encoding name or one
        // derived from a code page), when it is not UTF-8.
        virtual std::optional<std::string> recordEncoding() = 0;

        // Caller-supplied last resort.
        virtual const std::optional<std::string>& fallbackEncoding() const = 0;

        virtual logger::Logger* log() const = 0;
    };

    // A policy validating a final value; throws on rejection.
    template <typename T>
    using Check = std::function<void(const std::string& name, const T& value)>;


    namespace validators {

        // ---------- Typed ----------
        const bencode::Integer& expect_int(const std::string& name, const bencode::BencodeValue& raw);
        const std::string& expect_bytes(const std::string& name, const bencode::BencodeValue& raw);
        const bencode::BencodeValue::List& expect_list(const std::string& name, const bencode::BencodeValue& raw);
        const bencode::Dict& expect_dict(const std::string& name, const bencode::BencodeValue& raw);

        // ---------- Bounded ----------
        Check<bencode::Integer> bounded(std::optional<bencode::Integer> min, std::optional<bencode::Integer> max);

        // ---------- NonEmpty ----------
        bool is_blank(const std::string& s) noexcept;
        Check<std::string> non_empty();

        // Assigned text must be well-formed UTF-8.
        Check<std::string> utf8_text();

        // ---------- Encoded ----------
        /**
         * @brief Character sets to try, in order. An explicit encoding is the
         * only candidate. Otherwise: the record encoding, UTF-8, then the
         * fallback, without repeats.
         */
        std::vector<std::string> candidate_encodings(const std::optional<std::string>& explicitEncoding,
                                                     TextContext& ctx);

        // Raises TextDecodeError naming every encoding tried.
        std::string decode_encoded(const std::string& name, const std::string& raw,
                                   const std::optional<std::string>& explicitEncoding, TextContext& ctx);

        // ---------- UnixEpoch ----------
        inline constexpr int64_t kMinEpoch = 0;                 // 1970-01-01T00:00:00Z
        inline constexpr int64_t kMaxEpoch = 32535215999;       // 3000-12-31T23:59:59Z

        Timestamp from_unix_epoch(const std::string& name, const bencode::Integer& seconds);
        Check<Timestamp> timezone_aware();
        // Assigned timestamps must fit the range accepted on load.
        Check<Timestamp> within_epoch();

        // ---------- ValidUrl ----------
        std::vector<std::string> default_url_schemes();
        void check_url(const std::string& name, const std::string& value, const std::vector<std::string>& schemes);
        Check<std::string> valid_url(std::vector<std::string> schemes);

        // ---------- ValidNode ----------
        // [host, port] to "host:port".
        std::string node_from_pair(const std::string& name, const bencode::BencodeValue& item);
        // Checks "host:port" and returns it unchanged.
        std::string check_node(const std::string& name, const std::string& node);
        bencode::BencodeValue node_to_pair(const std::string& node);

        // ---------- ValidTier ----------
        using Tier = std::vector<std::string>;
        Tier tier_from_list(const std::string& name, const bencode::BencodeValue& item);
        Tier check_tier(const std::string& name, const Tier& tier);

    } // namespace validators

} // namespace clot::torrent
