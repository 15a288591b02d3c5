#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "backbone.hpp"


namespace clot::torrent {

    // Field declarations shared by every Metainfo instance.
    struct MetainfoFields
    {
        Field<bencode::Dict> info;
        Field<std::string> announce;
        Field<List<validators::Tier>> announceList;
        Field<Timestamp> creationDate;
        Field<std::string> comment;
        Field<std::string> createdBy;
        Field<std::string> encoding;
        Field<std::string> publisher;
        Field<std::string> publisherUrl;
        Field<List<std::string>> nodes;
        Field<List<std::string>> urlList;
        Field<bencode::Integer> isPrivate;
        Field<bencode::Integer> codepage;

        static const MetainfoFields& get();
    };


    /**
     * @brief Contents of a .torrent file.
     *
     * Text fields decode with the record's own `encoding` or `codepage` when
     * either names a character set other than UTF-8.
     */
    class Metainfo : public Backbone
    {
    public:
        explicit Metainfo(std::string_view rawBytes, const ParseOptions& opts = {},
                          std::optional<std::filesystem::path> filePath = std::nullopt);

        Attr<bencode::Dict> info;
        Attr<std::string> announce;
        Attr<List<validators::Tier>> announceList;
        Attr<Timestamp> creationDate;
        Attr<std::string> comment;
        Attr<std::string> createdBy;
        Attr<std::string> encoding;
        Attr<std::string> publisher;
        Attr<std::string> publisherUrl;
        Attr<List<std::string>> nodes;
        Attr<List<std::string>> urlList;
        Attr<bencode::Integer> isPrivate;
        Attr<bencode::Integer> codepage;

        std::optional<std::string> recordEncoding() override;

        // SHA-1 of the bencoded info dictionary; nullopt without one.
        std::optional<std::array<uint8_t,20>> infoHash();
        std::string infoHashHex();
    };


    std::unique_ptr<Metainfo> create(const ParseOptions& opts = {});
    std::unique_ptr<Metainfo> parse(std::string_view rawBytes, const ParseOptions& opts = {});
    std::unique_ptr<Metainfo> load(const std::filesystem::path& path, const ParseOptions& opts = {});

} // namespace clot::torrent
