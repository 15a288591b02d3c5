#pragma once
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>



namespace clot::bencode {

    /**
     * @brief Signed integer covering the full 64-bit unsigned magnitude range
     * in both directions: -(2^64 - 1) .. 2^64 - 1.
     */
    class Integer
    {
    public:
        Integer() = default;

        template <std::integral I>
        Integer(I v) {
            if constexpr (std::is_signed_v<I>) {
                negative_ = v < 0;
                magnitude_ = negative_ ? uint64_t(0) - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
            } else {
                magnitude_ = static_cast<uint64_t>(v);
            }
        }

        static Integer fromMagnitude(bool negative, uint64_t magnitude) noexcept;

        bool negative() const noexcept { return negative_; }
        uint64_t magnitude() const noexcept { return magnitude_; }

        bool fitsInt64() const noexcept;
        int64_t asInt64() const;
        std::string toString() const;

        bool operator==(const Integer& other) const noexcept = default;
        std::strong_ordering operator<=>(const Integer& other) const noexcept;

    private:
        bool negative_{false};      // never true for zero
        uint64_t magnitude_{0};
    };


    class BencodeValue;

    /**
     * @brief Dictionary key. Text keys and byte keys with the same bytes are
     * distinct entries; the encoder rejects such pairs as duplicates.
     */
    struct DictKey
    {
        std::string bytes;
        bool text{true};

        DictKey() = default;
        DictKey(std::string s) : bytes(std::move(s)) {}
        DictKey(std::string_view s) : bytes(s) {}
        DictKey(const char* s) : bytes(s) {}

        static DictKey raw(std::string s) { DictKey k(std::move(s)); k.text = false; return k; }

        bool operator==(const DictKey&) const = default;
    };


    /**
     * @brief Insertion-ordered mapping from keys to values.
     * Lookup by name only matches text keys.
     */
    class Dict
    {
    public:
        using Entry = std::pair<DictKey, BencodeValue>;
        using iterator = std::vector<Entry>::iterator;
        using const_iterator = std::vector<Entry>::const_iterator;

        Dict() = default;
        Dict(std::initializer_list<Entry> entries);

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

        iterator begin() noexcept { return entries_.begin(); }
        iterator end() noexcept { return entries_.end(); }
        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }

        BencodeValue* find(std::string_view name);
        const BencodeValue* find(std::string_view name) const;
        BencodeValue* findKey(const DictKey& key);
        const BencodeValue* findKey(const DictKey& key) const;

        bool contains(std::string_view name) const { return find(name) != nullptr; }
        bool containsKey(const DictKey& key) const { return findKey(key) != nullptr; }

        // Inserts a text key holding None if absent.
        BencodeValue& operator[](std::string_view name);

        // Replaces the value in place when the key exists, appends otherwise.
        void set(DictKey key, BencodeValue value);

        // Appends only when the key is new; returns false on a duplicate.
        bool insert(DictKey key, BencodeValue value);

        // Appends without a lookup; the caller guarantees the key is new.
        void append(DictKey key, BencodeValue value);

        bool erase(std::string_view name);
        bool eraseKey(const DictKey& key);
        std::optional<BencodeValue> pop(std::string_view name);

        // Key-set and value equality; iteration order is not compared.
        bool operator==(const Dict& other) const;

    private:
        std::vector<Entry> entries_;
    };


    class BencodeValue
    {
    public:
        enum class Type { None, Int, Bool, Bytes, Text, List, Dict };

        using List = std::vector<BencodeValue>;

        BencodeValue();

        template <std::integral I>
        requires (!std::same_as<I, bool>)
        BencodeValue(I i) : type_(Type::Int), intValue_(i) {}

        BencodeValue(Integer i);
        BencodeValue(bool b);
        BencodeValue(const char* s);
        BencodeValue(const std::string& s);
        BencodeValue(std::string&& s);
        BencodeValue(std::string_view s);
        BencodeValue(const List& l);
        BencodeValue(List&& l);
        BencodeValue(const bencode::Dict& d);
        BencodeValue(bencode::Dict&& d);

        // Byte strings are the default for string construction.
        static BencodeValue text(std::string s);

        bool isNone()   const noexcept { return type_ == Type::None; }
        bool isInt()    const noexcept;
        bool isBool()   const noexcept;
        bool isBytes()  const noexcept;
        bool isText()   const noexcept;
        bool isString() const noexcept;     // bytes or text
        bool isList()   const noexcept;
        bool isDict()   const noexcept;

        const Integer& asInt() const;
        bool asBool() const;
        const std::string& asString() const;
        const List& asList() const;
        List& asList();
        const bencode::Dict& asDict() const;
        bencode::Dict& asDict();

        std::string toString() const;
        Type type() const noexcept { return type_; }

        bool operator==(const BencodeValue& other) const;

    private:
        Type type_{Type::None};
        Integer intValue_;
        bool boolValue_{false};
        std::string strValue_;
        List listValue_;
        bencode::Dict dictValue_;
    };

    const char* type_name(BencodeValue::Type t) noexcept;


    // ---------- Errors ----------

    enum class DecodeErrc
    {
        Empty,
        UnknownTypeSelector,
        MissingLengthDelimiter,
        MalformedLength,
        LengthOutOfBounds,
        MissingIntegerTerminator,
        MalformedInteger,
        IntegerOutOfRange,
        MissingListTerminator,
        MissingDictTerminator,
        UnsupportedKeyType,
        DuplicateKey,
        InvalidUtf8Key,
        TrailingBytes,
        NestingTooDeep,
    };

    class DecodeError : public std::runtime_error
    {
    public:
        DecodeError(DecodeErrc code, size_t pos, const std::string& detail);

        DecodeErrc code() const noexcept { return code_; }
        size_t position() const noexcept { return pos_; }

    private:
        DecodeErrc code_;
        size_t pos_;
    };

    enum class EncodeErrc { UnsupportedType, DuplicateKey };

    class EncodeError : public std::runtime_error
    {
    public:
        EncodeError(EncodeErrc code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

        EncodeErrc code() const noexcept { return code_; }

    private:
        EncodeErrc code_;
    };


    // ---------- Codec ----------

    enum class KeyMode
    {
        bytes,          // keys stay raw byte strings
        text,           // keys must be UTF-8, InvalidUtf8Key otherwise
        textOrBytes,    // UTF-8 keys become text, the rest stay bytes
    };

    struct DecodeOptions
    {
        KeyMode keys{KeyMode::bytes};
        size_t maxDepth{1000};
    };


    class Decoder
    {
    public:
        static BencodeValue decode(std::string_view input, const DecodeOptions& opts = {});

    private:
        Decoder(std::string_view input, const DecodeOptions& opts);

        // Recursive Descent
        BencodeValue parseValue();
        BencodeValue parseInt();
        BencodeValue parseString();
        BencodeValue parseList();
        BencodeValue parseDict();

        DictKey makeKey(std::string bytes, size_t keyPos) const;

        std::string_view input_;
        DecodeOptions opts_;
        size_t pos_{0};
        size_t depth_{0};
    };


    using ChunkSink = std::function<void(std::string_view)>;

    // Pushes the encoding of value to sink, one chunk per syntactic part.
    void iterencode(const BencodeValue& value, const ChunkSink& sink);

    std::string encode(const BencodeValue& value);

    inline BencodeValue decode(std::string_view input, const DecodeOptions& opts = {}) {
        return Decoder::decode(input, opts);
    }

}
