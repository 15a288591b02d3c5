#include "../include/backbone.hpp"
#include "../../bencode/include/utf8.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace clot::torrent {

    using ojson = nlohmann::ordered_json;
    using bencode::BencodeValue;

    static std::string to_hex(std::string_view bytes) {
        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0f]);
        }
        return out;
    }

    // Bytes that are not UTF-8 are shown as "hex::" followed by lowercase hex.
    static std::string json_text(const std::string& bytes) {
        if (bencode::is_valid_utf8(bytes)) return bytes;
        return "hex::" + to_hex(bytes);
    }

    static ojson to_json(const BencodeValue& v, bool sortKeys);

    static ojson dict_to_json(const bencode::Dict& d, bool sortKeys) {
        std::vector<std::pair<std::string, const BencodeValue*>> entries;
        entries.reserve(d.size());
        for (const auto& [k, val] : d) entries.emplace_back(json_text(k.bytes), &val);

        if (sortKeys) {
            std::stable_sort(entries.begin(), entries.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
        }

        // A byte key and a text key may render alike ("hex::ff", or "x" twice).
        ojson obj = ojson::object();
        for (const auto& [k, val] : entries) {
            if (obj.contains(k)) throw ValueError("cannot dump key " + ojson(k).dump() + " twice");
            obj[k] = to_json(*val, sortKeys);
        }
        return obj;
    }

    static ojson to_json(const BencodeValue& v, bool sortKeys) {
        switch (v.type()) {
            case BencodeValue::Type::None:
                return nullptr;
            case BencodeValue::Type::Int: {
                const auto& i = v.asInt();
                if (i.fitsInt64()) return i.asInt64();
                if (!i.negative()) return i.magnitude();
                throw ValueError("cannot represent " + i.toString() + " in JSON");
            }
            case BencodeValue::Type::Bool:
                return v.asBool();
            case BencodeValue::Type::Bytes:
            case BencodeValue::Type::Text:
                return json_text(v.asString());
            case BencodeValue::Type::List: {
                ojson arr = ojson::array();
                for (const auto& item : v.asList()) arr.push_back(to_json(item, sortKeys));
                return arr;
            }
            case BencodeValue::Type::Dict:
                return dict_to_json(v.asDict(), sortKeys);
        }
        return nullptr;
    }

    // One line with ", " and ": " separators.
    static void write_flat(const ojson& j, std::string& out) {
        if (j.is_object()) {
            out += '{';
            bool first = true;
            for (const auto& el : j.items()) {
                if (!first) out += ", ";
                first = false;
                out += ojson(el.key()).dump();
                out += ": ";
                write_flat(el.value(), out);
            }
            out += '}';
        } else if (j.is_array()) {
            out += '[';
            bool first = true;
            for (const auto& item : j) {
                if (!first) out += ", ";
                first = false;
                write_flat(item, out);
            }
            out += ']';
        } else {
            out += j.dump();
        }
    }

    std::string Backbone::dumps(const DumpOptions& opts) {
        saveFields();

        ojson root = dict_to_json(data_, opts.sortKeys);

        // Fields with a readable form (timestamps) replace their stored value.
        for (const auto* attr : layout_.attrs()) {
            auto text = attr->displayText();
            if (text && root.contains(attr->key())) root[attr->key()] = *text;
        }

        if (opts.indentWithTabs) return root.dump(opts.indent.value_or(1), '\t');
        if (opts.indent) return root.dump(*opts.indent, ' ');

        std::string out;
        write_flat(root, out);
        return out;
    }

} // namespace clot::torrent
