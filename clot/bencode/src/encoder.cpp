#include "../include/bencode.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace clot::bencode {

    static void encode_impl(const BencodeValue& v, const ChunkSink& sink);

    static void encode_int(const Integer& x, const ChunkSink& sink) {
        sink("i");
        sink(x.toString());
        sink("e");
    }

    static void encode_bool(bool b, const ChunkSink& sink) {
        sink("i");
        sink(b ? "1" : "0");
        sink("e");
    }

    static void encode_string(std::string_view s, const ChunkSink& sink) {
        sink(std::to_string(s.size()));
        sink(":");
        if (!s.empty()) sink(s);
    }

    static void encode_list(const BencodeValue::List& lst, const ChunkSink& sink) {
        sink("l");
        for (const auto& e : lst) encode_impl(e, sink);
        sink("e");
    }

    static void encode_dict(const Dict& dict, const ChunkSink& sink) {

        // Keys are projected to raw bytes and sorted; a byte key sorts before
        // a text key with the same bytes, so it is the one reported.
        std::vector<const Dict::Entry*> sorted;
        sorted.reserve(dict.size());
        for (const auto& e : dict) sorted.push_back(&e);

        std::stable_sort(sorted.begin(), sorted.end(), [](const Dict::Entry* a, const Dict::Entry* b) {
            if (a->first.bytes != b->first.bytes) return a->first.bytes < b->first.bytes;
            return !a->first.text && b->first.text;
        });

        for (size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i - 1]->first.bytes == sorted[i]->first.bytes) {
                throw EncodeError(EncodeErrc::DuplicateKey, "duplicate key " + sorted[i - 1]->first.bytes);
            }
        }

        sink("d");
        for (const auto* e : sorted) {
            encode_string(e->first.bytes, sink);
            encode_impl(e->second, sink);
        }
        sink("e");
    }

    static void encode_impl(const BencodeValue& v, const ChunkSink& sink) {

        switch (v.type()) {
            case BencodeValue::Type::None:
                throw EncodeError(EncodeErrc::UnsupportedType, "object of type None cannot be encoded");
            case BencodeValue::Type::Int:
                encode_int(v.asInt(), sink);
                break;
            case BencodeValue::Type::Bool:
                encode_bool(v.asBool(), sink);
                break;
            case BencodeValue::Type::Bytes:
            case BencodeValue::Type::Text:
                encode_string(v.asString(), sink);
                break;
            case BencodeValue::Type::List:
                encode_list(v.asList(), sink);
                break;
            case BencodeValue::Type::Dict:
                encode_dict(v.asDict(), sink);
                break;
        }
    }

    void iterencode(const BencodeValue& value, const ChunkSink& sink) {
        encode_impl(value, sink);
    }

    std::string encode(const BencodeValue& value) {
        std::string out;
        out.reserve(256); // small headroom
        encode_impl(value, [&out](std::string_view chunk) { out.append(chunk.data(), chunk.size()); });
        return out;
    }

}
