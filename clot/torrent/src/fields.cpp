#include "../include/fields.hpp"
#include <memory>

namespace clot::torrent::fields {

    using bencode::BencodeValue;
    namespace v = validators;

    static const std::optional<std::string> kUtf8{"UTF-8"};

    static std::string attribute_name(std::string key) {
        for (auto& c : key) {
            if (c == ' ' || c == '-') c = '_';
        }
        return key;
    }

    FieldKey::FieldKey(const char* k) : key(k), name(attribute_name(k)) {}

    FieldKey::FieldKey(std::string k) : key(std::move(k)) { name = attribute_name(key); }


    template <typename X>
    static Field<X> make(FieldKey k) {
        Field<X> f;
        f.key = std::move(k.key);
        f.name = std::move(k.name);
        return f;
    }

    // Lists built elsewhere are re-validated by this field's item check;
    // lists already built around it are kept as they are.
    template <typename X>
    static typename Field<List<X>>::Adopt adopt_into(std::shared_ptr<const typename List<X>::ValidItem> item) {
        return [item](List<X> l) {
            if (l.validator() == item) return l;
            return List<X>::of(item, l.items());
        };
    }

    // Text as stored: already-decoded text is taken as is.
    static std::string utf8_of(const std::string& name, const BencodeValue& raw, TextContext& ctx) {
        if (raw.isText()) return raw.asString();
        return v::decode_encoded(name, v::expect_bytes(name, raw), kUtf8, ctx);
    }


    Field<bencode::Dict> dictionary(FieldKey k) {
        auto f = make<bencode::Dict>(std::move(k));
        f.load = [](const std::string& name, const BencodeValue& raw, TextContext&) {
            return v::expect_dict(name, raw);
        };
        f.store = [](const bencode::Dict& d) -> std::optional<BencodeValue> { return BencodeValue(d); };
        return f;
    }

    Field<bencode::Integer> integer(FieldKey k, std::optional<bencode::Integer> min, std::optional<bencode::Integer> max) {
        auto f = make<bencode::Integer>(std::move(k));
        f.load = [](const std::string& name, const BencodeValue& raw, TextContext&) {
            return v::expect_int(name, raw);
        };
        f.store = [](const bencode::Integer& i) -> std::optional<BencodeValue> { return BencodeValue(i); };
        if (min || max) f.checks.push_back(v::bounded(min, max));
        return f;
    }

    Field<std::string> bytes(FieldKey k) {
        auto f = make<std::string>(std::move(k));
        f.load = [](const std::string& name, const BencodeValue& raw, TextContext&) {
            return v::expect_bytes(name, raw);
        };
        f.store = [](const std::string& s) -> std::optional<BencodeValue> { return BencodeValue(s); };
        f.checks.push_back(v::non_empty());
        return f;
    }

    Field<std::string> string(FieldKey k, std::optional<std::string> encoding) {
        auto f = make<std::string>(std::move(k));
        f.load = [encoding](const std::string& name, const BencodeValue& raw, TextContext& ctx) -> std::string {
            if (raw.isText()) return raw.asString();
            return v::decode_encoded(name, v::expect_bytes(name, raw), encoding, ctx);
        };
        f.store = [](const std::string& s) -> std::optional<BencodeValue> { return BencodeValue::text(s); };
        f.checks.push_back(v::utf8_text());
        f.checks.push_back(v::non_empty());
        return f;
    }

    Field<std::string> url(FieldKey k, std::vector<std::string> schemes) {
        auto f = make<std::string>(std::move(k));
        f.load = utf8_of;
        f.store = [](const std::string& s) -> std::optional<BencodeValue> { return BencodeValue::text(s); };
        f.checks.push_back(v::utf8_text());
        f.checks.push_back(v::non_empty());
        f.checks.push_back(v::valid_url(std::move(schemes)));
        return f;
    }

    Field<Timestamp> timestamp(FieldKey k) {
        auto f = make<Timestamp>(std::move(k));
        f.load = [](const std::string& name, const BencodeValue& raw, TextContext&) {
            return v::from_unix_epoch(name, v::expect_int(name, raw));
        };
        f.store = [](const Timestamp& t) -> std::optional<BencodeValue> { return BencodeValue(t.toUnix()); };
        f.display = [](const Timestamp& t) -> std::optional<std::string> { return t.isoformat(); };
        f.checks.push_back(v::timezone_aware());
        f.checks.push_back(v::within_epoch());
        return f;
    }

    Field<List<std::string>> urlList(FieldKey k, std::vector<std::string> schemes) {
        const auto nonEmpty = v::non_empty();
        auto item = std::make_shared<const List<std::string>::ValidItem>(
            [name = k.name, schemes = std::move(schemes), nonEmpty](const std::string& u) {
                nonEmpty(name, u);
                v::check_url(name, u, schemes);
                return u;
            });

        auto f = make<List<std::string>>(std::move(k));
        f.load = [item](const std::string& name, const BencodeValue& raw, TextContext& ctx) {
            std::vector<std::string> urls;
            if (raw.isList()) {
                for (const auto& u : raw.asList()) urls.push_back(utf8_of(name, u, ctx));
            } else {
                urls.push_back(utf8_of(name, raw, ctx));    // a bare URL
            }
            return List<std::string>::of(item, urls);
        };
        f.store = [](const List<std::string>& urls) -> std::optional<BencodeValue> {
            if (urls.empty()) return std::nullopt;
            if (urls.size() == 1) return BencodeValue::text(urls.at(0));

            BencodeValue::List out;
            for (const auto& u : urls) out.push_back(BencodeValue::text(u));
            return BencodeValue(std::move(out));
        };
        f.adopt = adopt_into<std::string>(item);
        return f;
    }

    Field<List<std::string>> nodeList(FieldKey k) {
        auto item = std::make_shared<const List<std::string>::ValidItem>(
            [name = k.name](const std::string& node) { return v::check_node(name, node); });

        auto f = make<List<std::string>>(std::move(k));
        f.load = [item](const std::string& name, const BencodeValue& raw, TextContext&) {
            std::vector<std::string> nodes;
            for (const auto& pair : v::expect_list(name, raw)) nodes.push_back(v::node_from_pair(name, pair));
            return List<std::string>::of(item, nodes);
        };
        f.store = [](const List<std::string>& nodes) -> std::optional<BencodeValue> {
            if (nodes.empty()) return std::nullopt;

            BencodeValue::List out;
            for (const auto& n : nodes) out.push_back(v::node_to_pair(n));
            return BencodeValue(std::move(out));
        };
        f.adopt = adopt_into<std::string>(item);
        return f;
    }

    Field<List<Tier>> announceList(FieldKey k) {
        auto item = std::make_shared<const List<Tier>::ValidItem>(
            [name = k.name](const Tier& tier) { return v::check_tier(name, tier); });

        auto f = make<List<Tier>>(std::move(k));
        f.load = [item](const std::string& name, const BencodeValue& raw, TextContext&) {
            std::vector<Tier> tiers;
            for (const auto& tier : v::expect_list(name, raw)) tiers.push_back(v::tier_from_list(name, tier));
            return List<Tier>::of(item, tiers);
        };
        f.store = [](const List<Tier>& tiers) -> std::optional<BencodeValue> {
            if (tiers.empty()) return std::nullopt;

            BencodeValue::List out;
            for (const auto& tier : tiers) {
                BencodeValue::List urls(tier.begin(), tier.end());
                out.push_back(BencodeValue(std::move(urls)));
            }
            return BencodeValue(std::move(out));
        };
        f.adopt = adopt_into<Tier>(item);
        return f;
    }

} // namespace clot::torrent::fields
