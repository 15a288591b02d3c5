#include "../include/metainfo.hpp"
#include "../include/text_codec.hpp"
#include <openssl/sha.h>

namespace clot::torrent {

    static std::array<uint8_t,20> sha1_bytes(const void* data, size_t len) {
        std::array<uint8_t,20> out;
        SHA1(static_cast<const unsigned char*>(data), len, out.data());
        return out;
    }

    const MetainfoFields& MetainfoFields::get() {
        static const MetainfoFields f{
            .info         = fields::dictionary("info"),
            .announce     = fields::url("announce"),
            .announceList = fields::announceList("announce-list"),
            .creationDate = fields::timestamp("creation date"),
            .comment      = fields::string("comment"),
            .createdBy    = fields::string("created by"),
            .encoding     = fields::as_context(fields::string("encoding", "ASCII")),
            .publisher    = fields::string("publisher"),
            .publisherUrl = fields::url("publisher-url"),
            .nodes        = fields::nodeList("nodes"),
            .urlList      = fields::urlList("url-list"),
            .isPrivate    = fields::integer("private", 0, 1),
            .codepage     = fields::as_context(fields::integer("codepage", 1)),
        };
        return f;
    }


    Metainfo::Metainfo(std::string_view rawBytes, const ParseOptions& opts,
                       std::optional<std::filesystem::path> filePath)
    : Backbone(rawBytes, opts, std::move(filePath)),
      info(layout(), MetainfoFields::get().info),
      announce(layout(), MetainfoFields::get().announce),
      announceList(layout(), MetainfoFields::get().announceList),
      creationDate(layout(), MetainfoFields::get().creationDate),
      comment(layout(), MetainfoFields::get().comment),
      createdBy(layout(), MetainfoFields::get().createdBy),
      encoding(layout(), MetainfoFields::get().encoding),
      publisher(layout(), MetainfoFields::get().publisher),
      publisherUrl(layout(), MetainfoFields::get().publisherUrl),
      nodes(layout(), MetainfoFields::get().nodes),
      urlList(layout(), MetainfoFields::get().urlList),
      isPrivate(layout(), MetainfoFields::get().isPrivate),
      codepage(layout(), MetainfoFields::get().codepage)
    {}

    std::optional<std::string> Metainfo::recordEncoding() {
        if (const auto& enc = encoding.get(); enc && !is_utf8_name(*enc)) return enc;

        if (const auto& cp = codepage.get()) {
            std::string enc = codepage_encoding(cp->magnitude());
            if (!is_utf8_name(enc)) return enc;
        }
        return std::nullopt;
    }

    std::optional<std::array<uint8_t,20>> Metainfo::infoHash() {
        const auto& dict = info.get();
        if (!dict) return std::nullopt;

        const std::string raw = bencode::encode(bencode::BencodeValue(*dict));
        return sha1_bytes(raw.data(), raw.size());
    }

    std::string Metainfo::infoHashHex() {
        static const char* digits = "0123456789abcdef";

        const auto hash = infoHash();
        if (!hash) return {};

        std::string out;
        out.reserve(40);
        for (uint8_t b : *hash) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0f]);
        }
        return out;
    }


    std::unique_ptr<Metainfo> create(const ParseOptions& opts) {
        return create_as<Metainfo>(opts);
    }

    std::unique_ptr<Metainfo> parse(std::string_view rawBytes, const ParseOptions& opts) {
        return parse_as<Metainfo>(rawBytes, opts);
    }

    std::unique_ptr<Metainfo> load(const std::filesystem::path& path, const ParseOptions& opts) {
        return load_as<Metainfo>(path, opts);
    }

} // namespace clot::torrent
