#include "../include/bencode.hpp"
#include "../include/utf8.hpp"
#include <cstdio>
#include <limits>
#include <string>
#include <unordered_set>

namespace clot::bencode {

    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    static std::string selector_repr(char c) {
        char buf[8];
        std::snprintf(buf, sizeof buf, "0x%02X", static_cast<unsigned>(static_cast<unsigned char>(c)));
        return buf;
    }

    // Canonical unsigned decimal: digits only, no leading zero unless the text is "0".
    static bool is_canonical_decimal(std::string_view s) noexcept {
        if (s.empty()) return false;
        for (char c : s) {
            if (!is_digit(c)) return false;
        }
        return s.size() == 1 || s[0] != '0';
    }

    static bool parse_magnitude(std::string_view s, uint64_t& out) noexcept {
        uint64_t mag = 0;
        for (char c : s) {
            const uint64_t d = uint64_t(c - '0');
            if (mag > (std::numeric_limits<uint64_t>::max() - d) / 10ULL) return false;
            mag = mag * 10ULL + d;
        }
        out = mag;
        return true;
    }


    Decoder::Decoder(std::string_view input, const DecodeOptions& opts) : input_(input), opts_(opts), pos_(0) {}

    BencodeValue Decoder::decode(std::string_view input, const DecodeOptions& opts) {

        if (input.empty()) {
            throw DecodeError(DecodeErrc::Empty, 0, "value is empty");
        }

        Decoder d(input, opts);
        BencodeValue v = d.parseValue();

        if (d.pos_ != input.size()) {
            throw DecodeError(DecodeErrc::TrailingBytes, d.pos_, "extra bytes at the end");
        }
        return v;
    }

    BencodeValue Decoder::parseValue() {
        // Callers guarantee pos_ < size.
        const char c = input_[pos_];
        if (is_digit(c)) return parseString();
        if (c == 'i') return parseInt();
        if (c == 'l') return parseList();
        if (c == 'd') return parseDict();
        throw DecodeError(DecodeErrc::UnknownTypeSelector, pos_, "unknown type selector " + selector_repr(c));
    }


    BencodeValue Decoder::parseString() {
        const size_t start = pos_;
        const size_t colon = input_.find(':', start + 1);

        if (colon == std::string_view::npos) {
            throw DecodeError(DecodeErrc::MissingLengthDelimiter, start, "missing data size delimiter");
        }

        const std::string_view lenText = input_.substr(start, colon - start);
        if (!is_canonical_decimal(lenText)) {
            throw DecodeError(DecodeErrc::MalformedLength, start, "malformed data size");
        }

        uint64_t len = 0;
        const size_t dataStart = colon + 1;
        if (!parse_magnitude(lenText, len) || len > input_.size() - dataStart) {
            throw DecodeError(DecodeErrc::LengthOutOfBounds, start, "wrong data size");
        }

        std::string out(input_.substr(dataStart, static_cast<size_t>(len)));
        pos_ = dataStart + static_cast<size_t>(len);
        return BencodeValue(std::move(out));
    }


    BencodeValue Decoder::parseInt() {
        const size_t start = pos_ + 1;
        const size_t end = input_.find('e', start);

        if (end == std::string_view::npos) {
            throw DecodeError(DecodeErrc::MissingIntegerTerminator, pos_, "missing int value terminator");
        }

        std::string_view text = input_.substr(start, end - start);
        const bool neg = !text.empty() && text[0] == '-';
        const std::string_view digits = neg ? text.substr(1) : text;

        // Leading zero rules (allow "i0e", forbid "-0", forbid leading zeros, "+" and blanks)
        if (!is_canonical_decimal(digits) || (neg && digits == "0")) {
            throw DecodeError(DecodeErrc::MalformedInteger, start, "malformed int value");
        }

        uint64_t mag = 0;
        if (!parse_magnitude(digits, mag)) {
            throw DecodeError(DecodeErrc::IntegerOutOfRange, start, "int value out of range");
        }

        pos_ = end + 1;
        return BencodeValue(Integer::fromMagnitude(neg, mag));
    }


    BencodeValue Decoder::parseList() {
        const size_t start = pos_;
        if (++depth_ > opts_.maxDepth) {
            throw DecodeError(DecodeErrc::NestingTooDeep, start, "nesting too deep");
        }

        BencodeValue::List lst;
        ++pos_;
        while (pos_ < input_.size()) {
            if (input_[pos_] == 'e') {
                ++pos_;
                --depth_;
                return BencodeValue(std::move(lst));
            }
            lst.push_back(parseValue());
        }

        throw DecodeError(DecodeErrc::MissingListTerminator, start, "missing list value terminator");
    }


    DictKey Decoder::makeKey(std::string bytes, size_t keyPos) const {
        switch (opts_.keys) {
            case KeyMode::bytes:
                return DictKey::raw(std::move(bytes));
            case KeyMode::text:
                if (!is_valid_utf8(bytes)) {
                    throw DecodeError(DecodeErrc::InvalidUtf8Key, keyPos,
                                      "not a UTF-8 key " + BencodeValue(bytes).toString());
                }
                return DictKey(std::move(bytes));
            case KeyMode::textOrBytes:
                if (is_valid_utf8(bytes)) return DictKey(std::move(bytes));
                return DictKey::raw(std::move(bytes));
        }
        return DictKey::raw(std::move(bytes));
    }

    BencodeValue Decoder::parseDict() {
        const size_t start = pos_;
        if (++depth_ > opts_.maxDepth) {
            throw DecodeError(DecodeErrc::NestingTooDeep, start, "nesting too deep");
        }

        Dict dict;
        std::unordered_set<std::string_view> seen;
        ++pos_;
        while (pos_ < input_.size()) {
            if (input_[pos_] == 'e') {
                ++pos_;
                --depth_;
                return BencodeValue(std::move(dict));
            }

            const size_t keyPos = pos_;
            BencodeValue key = parseValue();
            if (!key.isBytes()) {
                throw DecodeError(DecodeErrc::UnsupportedKeyType, keyPos,
                                  std::string("unsupported key type ") + type_name(key.type()));
            }

            // Duplicates are judged on raw bytes, before any text conversion.
            const std::string& raw = key.asString();
            if (!seen.insert(input_.substr(pos_ - raw.size(), raw.size())).second) {
                throw DecodeError(DecodeErrc::DuplicateKey, keyPos, "duplicate key " + key.toString());
            }

            if (pos_ >= input_.size()) break;

            BencodeValue val = parseValue();
            dict.append(makeKey(raw, keyPos), std::move(val));
        }

        throw DecodeError(DecodeErrc::MissingDictTerminator, start, "missing dict value terminator");
    }

}
