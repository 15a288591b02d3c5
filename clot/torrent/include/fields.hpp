#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "validators.hpp"
#include "values.hpp"


namespace clot::torrent {

    /**
     * @brief Immutable description of one record field: the dictionary key,
     * the name used in messages, how a stored value becomes a typed one and
     * back, and the checks every value must pass.
     *
     * Declared once per record type; each record instance binds it through
     * an Attr.
     */
    template <typename T>
    struct Field
    {
        using Load  = std::function<T(const std::string& name, const bencode::BencodeValue& raw, TextContext& ctx)>;
        using Store = std::function<std::optional<bencode::BencodeValue>(const T& value)>;   // nullopt deletes the key
        using Adopt = std::function<T(T value)>;
        using Display = std::function<std::optional<std::string>(const T& value)>;

        std::string key;
        std::string name;
        Load load;
        Store store;
        Adopt adopt;                // optional: reshapes an assigned value
        Display display;            // optional: dump text overriding the stored form
        std::vector<Check<T>> checks;
        bool context{false};        // other fields depend on it for text decoding

        void validate(const T& value) const {
            for (const auto& check : checks) check(name, value);
        }
    };


    namespace fields {

        using validators::Tier;

        // Dictionary key plus the field name; the name defaults to the key
        // with blanks and dashes turned into underscores.
        struct FieldKey
        {
            std::string key;
            std::string name;

            FieldKey(const char* k);
            FieldKey(std::string k);
            FieldKey(std::string k, std::string n) : key(std::move(k)), name(std::move(n)) {}
        };

        Field<bencode::Dict> dictionary(FieldKey k);

        Field<bencode::Integer> integer(FieldKey k,
                                        std::optional<bencode::Integer> min = std::nullopt,
                                        std::optional<bencode::Integer> max = std::nullopt);

        // Raw byte string, not blank.
        Field<std::string> bytes(FieldKey k);

        // Text decoded from the stored bytes, not blank. With an explicit
        // encoding that is the only character set tried.
        Field<std::string> string(FieldKey k, std::optional<std::string> encoding = std::nullopt);

        Field<std::string> url(FieldKey k, std::vector<std::string> schemes = validators::default_url_schemes());

        Field<Timestamp> timestamp(FieldKey k);

        // Stored as a bare URL, a list of URLs, or nothing when empty.
        Field<List<std::string>> urlList(FieldKey k, std::vector<std::string> schemes = validators::default_url_schemes());

        // "host:port" items, stored as [host, port] pairs.
        Field<List<std::string>> nodeList(FieldKey k);

        // Tiers of tracker URLs; an empty list deletes the key.
        Field<List<Tier>> announceList(FieldKey k);

        template <typename T>
        Field<T> as_context(Field<T> f) {
            f.context = true;
            return f;
        }

    } // namespace fields

} // namespace clot::torrent
