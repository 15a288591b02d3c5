#include "../include/bencode.hpp"
#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace clot::bencode {

    // ---------- Integer ----------

    Integer Integer::fromMagnitude(bool negative, uint64_t magnitude) noexcept {
        Integer i;
        i.magnitude_ = magnitude;
        i.negative_ = negative && magnitude != 0;
        return i;
    }

    bool Integer::fitsInt64() const noexcept {
        constexpr uint64_t ABS_INT64_MIN = uint64_t(1) << 63;
        return negative_ ? magnitude_ <= ABS_INT64_MIN
                         : magnitude_ <= uint64_t(std::numeric_limits<int64_t>::max());
    }

    int64_t Integer::asInt64() const {
        if (!fitsInt64()) throw std::out_of_range("Integer: " + toString() + " does not fit int64");
        if (!negative_) return static_cast<int64_t>(magnitude_);
        if (magnitude_ == uint64_t(1) << 63) return std::numeric_limits<int64_t>::min();
        return -static_cast<int64_t>(magnitude_);
    }

    std::string Integer::toString() const {
        std::string digits = std::to_string(magnitude_);
        return negative_ ? "-" + digits : digits;
    }

    std::strong_ordering Integer::operator<=>(const Integer& other) const noexcept {
        if (negative_ != other.negative_) {
            return negative_ ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        if (negative_) return other.magnitude_ <=> magnitude_;
        return magnitude_ <=> other.magnitude_;
    }


    // ---------- Dict ----------

    Dict::Dict(std::initializer_list<Entry> entries) {
        for (const auto& e : entries) set(e.first, e.second);
    }

    BencodeValue* Dict::find(std::string_view name) {
        for (auto& e : entries_) {
            if (e.first.text && e.first.bytes == name) return &e.second;
        }
        return nullptr;
    }

    const BencodeValue* Dict::find(std::string_view name) const {
        return const_cast<Dict*>(this)->find(name);
    }

    BencodeValue* Dict::findKey(const DictKey& key) {
        for (auto& e : entries_) {
            if (e.first == key) return &e.second;
        }
        return nullptr;
    }

    const BencodeValue* Dict::findKey(const DictKey& key) const {
        return const_cast<Dict*>(this)->findKey(key);
    }

    BencodeValue& Dict::operator[](std::string_view name) {
        if (auto* v = find(name)) return *v;
        entries_.emplace_back(DictKey(name), BencodeValue());
        return entries_.back().second;
    }

    void Dict::set(DictKey key, BencodeValue value) {
        if (auto* v = findKey(key)) {
            *v = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    bool Dict::insert(DictKey key, BencodeValue value) {
        if (findKey(key)) return false;
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    void Dict::append(DictKey key, BencodeValue value) {
        entries_.emplace_back(std::move(key), std::move(value));
    }

    bool Dict::erase(std::string_view name) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.first.text && e.first.bytes == name; });
        if (it == entries_.end()) return false;
        entries_.erase(it);
        return true;
    }

    bool Dict::eraseKey(const DictKey& key) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.first == key; });
        if (it == entries_.end()) return false;
        entries_.erase(it);
        return true;
    }

    std::optional<BencodeValue> Dict::pop(std::string_view name) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.first.text && e.first.bytes == name; });
        if (it == entries_.end()) return std::nullopt;
        BencodeValue v = std::move(it->second);
        entries_.erase(it);
        return v;
    }

    bool Dict::operator==(const Dict& other) const {
        if (entries_.size() != other.entries_.size()) return false;
        for (const auto& e : entries_) {
            const auto* v = other.findKey(e.first);
            if (!v || !(*v == e.second)) return false;
        }
        return true;
    }


    // ---------- BencodeValue ----------

    BencodeValue::BencodeValue() : type_(Type::None) {}

    BencodeValue::BencodeValue(Integer i) : type_(Type::Int), intValue_(i) {}

    BencodeValue::BencodeValue(bool b) : type_(Type::Bool), boolValue_(b) {}

    BencodeValue::BencodeValue(const char* s) : type_(Type::Bytes), strValue_(s) {}

    BencodeValue::BencodeValue(const std::string& s) : type_(Type::Bytes), strValue_(s) {}

    BencodeValue::BencodeValue(std::string&& s) : type_(Type::Bytes), strValue_(std::move(s)) {}

    BencodeValue::BencodeValue(std::string_view s) : type_(Type::Bytes), strValue_(s) {}

    BencodeValue::BencodeValue(const List& l) : type_(Type::List), listValue_(l) {}

    BencodeValue::BencodeValue(List&& l) : type_(Type::List), listValue_(std::move(l)) {}

    BencodeValue::BencodeValue(const bencode::Dict& d) : type_(Type::Dict), dictValue_(d) {}

    BencodeValue::BencodeValue(bencode::Dict&& d) : type_(Type::Dict), dictValue_(std::move(d)) {}

    BencodeValue BencodeValue::text(std::string s) {
        BencodeValue v(std::move(s));
        v.type_ = Type::Text;
        return v;
    }

    bool BencodeValue::isInt()    const noexcept { return type_ == Type::Int; }
    bool BencodeValue::isBool()   const noexcept { return type_ == Type::Bool; }
    bool BencodeValue::isBytes()  const noexcept { return type_ == Type::Bytes; }
    bool BencodeValue::isText()   const noexcept { return type_ == Type::Text; }
    bool BencodeValue::isString() const noexcept { return isBytes() || isText(); }
    bool BencodeValue::isList()   const noexcept { return type_ == Type::List; }
    bool BencodeValue::isDict()   const noexcept { return type_ == Type::Dict; }

    const Integer& BencodeValue::asInt() const {
        if (!isInt()) throw std::runtime_error("BencodeValue: not an int");
        return intValue_;
    }

    bool BencodeValue::asBool() const {
        if (!isBool()) throw std::runtime_error("BencodeValue: not a bool");
        return boolValue_;
    }

    const std::string& BencodeValue::asString() const {
        if (!isString()) throw std::runtime_error("BencodeValue: not a string");
        return strValue_;
    }

    const BencodeValue::List& BencodeValue::asList() const {
        if (!isList()) throw std::runtime_error("BencodeValue: not a list");
        return listValue_;
    }

    BencodeValue::List& BencodeValue::asList() {
        if (!isList()) throw std::runtime_error("BencodeValue: not a list");
        return listValue_;
    }

    const Dict& BencodeValue::asDict() const {
        if (!isDict()) throw std::runtime_error("BencodeValue: not a dict");
        return dictValue_;
    }

    Dict& BencodeValue::asDict() {
        if (!isDict()) throw std::runtime_error("BencodeValue: not a dict");
        return dictValue_;
    }

    bool BencodeValue::operator==(const BencodeValue& other) const {
        if (type_ != other.type_) return false;

        switch (type_) {
            case Type::None:  return true;
            case Type::Int:   return intValue_ == other.intValue_;
            case Type::Bool:  return boolValue_ == other.boolValue_;
            case Type::Bytes:
            case Type::Text:  return strValue_ == other.strValue_;
            case Type::List:  return listValue_ == other.listValue_;
            case Type::Dict:  return dictValue_ == other.dictValue_;
        }
        return false;
    }


    static void quote(std::ostringstream& oss, std::string_view s, bool escapeHigh) {
        static const char* hex = "0123456789abcdef";
        oss << '\'';
        for (unsigned char c : s) {
            if (c == '\\' || c == '\'') { oss << '\\' << char(c); }
            else if (c < 0x20 || c == 0x7F || (escapeHigh && c >= 0x80)) {
                oss << "\\x" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
            } else {
                oss << char(c);
            }
        }
        oss << '\'';
    }

    std::string BencodeValue::toString() const {

        // Debug-friendly dump (not canonical bencode)

        switch (type_) {

            case Type::None:   return "None";
            case Type::Int:    return intValue_.toString();
            case Type::Bool:   return boolValue_ ? "True" : "False";

            case Type::Bytes:
            case Type::Text: {
                std::ostringstream oss;
                if (type_ == Type::Bytes) oss << 'b';
                quote(oss, strValue_, type_ == Type::Bytes);
                return oss.str();
            }

            case Type::List: {

                std::string out = "[";
                bool first = true;
                for (auto& v : listValue_) {
                    if (!first) out += ", ";
                    first = false;
                    out += v.toString();
                }
                out += "]";
                return out;

            }

            case Type::Dict: {

                std::string out = "{";
                bool first = true;
                for (auto& kv : dictValue_) {
                    if (!first) out += ", ";
                    first = false;
                    BencodeValue key = kv.first.text ? text(kv.first.bytes) : BencodeValue(kv.first.bytes);
                    out += key.toString();
                    out += ": ";
                    out += kv.second.toString();
                }
                out += "}";
                return out;

            }
        }

        return "None";
    }

    const char* type_name(BencodeValue::Type t) noexcept {
        switch (t) {
            case BencodeValue::Type::None:  return "None";
            case BencodeValue::Type::Int:   return "int";
            case BencodeValue::Type::Bool:  return "bool";
            case BencodeValue::Type::Bytes: return "bytes";
            case BencodeValue::Type::Text:  return "str";
            case BencodeValue::Type::List:  return "list";
            case BencodeValue::Type::Dict:  return "dict";
        }
        return "None";
    }


    // ---------- Errors ----------

    static std::string parse_error_message(size_t pos, const std::string& detail) {
        std::ostringstream oss;
        oss << "bencode parse error at " << pos << ": " << detail;
        return oss.str();
    }

    DecodeError::DecodeError(DecodeErrc code, size_t pos, const std::string& detail)
    : std::runtime_error(parse_error_message(pos, detail)), code_(code), pos_(pos) {}

}
