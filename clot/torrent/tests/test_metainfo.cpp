#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include "../include/metainfo.hpp"

using namespace clot::torrent;
using clot::bencode::BencodeValue;
using clot::bencode::DecodeErrc;
using clot::bencode::DecodeError;
using clot::bencode::Dict;
using clot::bencode::Integer;

namespace {

    using L = BencodeValue::List;
    using Strings = std::vector<std::string>;

    const std::string kLetterBe = "\xd0\x91";           // U+0411 in UTF-8

    std::string encoded(const Dict& d) {
        return clot::bencode::encode(BencodeValue(d));
    }

    DecodeErrc errc_of(std::string_view raw) {
        try {
            parse(raw);
        } catch (const DecodeError& e) {
            return e.code();
        }
        FAIL("expected DecodeError");
        return DecodeErrc::Empty;
    }

}

TEST_CASE("Metainfo: a new record has every field empty") {
    auto t = create();

    CHECK(t->data().empty());
    CHECK_FALSE(t->filePath().has_value());

    CHECK_FALSE(t->info.get().has_value());
    CHECK_FALSE(t->announce.get().has_value());
    CHECK_FALSE(t->announceList.get().has_value());
    CHECK_FALSE(t->creationDate.get().has_value());
    CHECK_FALSE(t->comment.get().has_value());
    CHECK_FALSE(t->createdBy.get().has_value());
    CHECK_FALSE(t->encoding.get().has_value());
    CHECK_FALSE(t->publisher.get().has_value());
    CHECK_FALSE(t->publisherUrl.get().has_value());
    CHECK_FALSE(t->nodes.get().has_value());
    CHECK_FALSE(t->urlList.get().has_value());
    CHECK_FALSE(t->isPrivate.get().has_value());
    CHECK_FALSE(t->codepage.get().has_value());
}

TEST_CASE("Metainfo: the mapping is parsed into fields") {
    const std::string raw = encoded(Dict{
        {"info", Dict{}},
        {"announce", "http://tracker/announce"},
        {"announce-list", L{L{"tracker"}, L{"backup1"}, L{"backup2"}}},
        {"creation date", 0},
        {"comment", "a trivial comment"},
        {"created by", "clot/0.0.0"},
        {"encoding", "UTF-8"},
        {"publisher", "torrent creator"},
        {"publisher-url", "http://creator.site/and/path"},
        {"nodes", L{L{"host-a", 123}, L{"host-b", 456}}},
        {"url-list", L{"http://mirror.com/pub", "http://another.com/pub"}},
        {"private", 1},
        {"codepage", 437},

        {"unknown to clot", "stays in data dict"},
    });

    auto t = parse(raw);

    CHECK(t->data() == Dict{{"unknown to clot", "stays in data dict"}});
    CHECK_FALSE(t->filePath().has_value());

    CHECK(t->info.get() == Dict{});
    CHECK(t->announce.get() == "http://tracker/announce");
    CHECK(*t->announceList.get() == std::vector<Strings>{{"tracker"}, {"backup1"}, {"backup2"}});
    CHECK(t->creationDate.get()->isoformat() == "1970-01-01T00:00:00+00:00");
    CHECK(t->comment.get() == "a trivial comment");
    CHECK(t->createdBy.get() == "clot/0.0.0");
    CHECK(t->encoding.get() == "UTF-8");
    CHECK(t->publisher.get() == "torrent creator");
    CHECK(t->publisherUrl.get() == "http://creator.site/and/path");
    CHECK(*t->nodes.get() == Strings{"host-a:123", "host-b:456"});
    CHECK(*t->urlList.get() == Strings{"http://mirror.com/pub", "http://another.com/pub"});
    CHECK(t->isPrivate.get() == Integer(1));
    CHECK(t->codepage.get() == Integer(437));

    SECTION("saving gives back the same bytes") {
        t->saveFields();
        CHECK(encoded(t->data()) == raw);
    }
}

TEST_CASE("Metainfo: fields can be lazy loaded") {
    const std::string raw = encoded(Dict{{"comment", "a trivial comment"}});

    ParseOptions opts;
    opts.lazy = true;
    auto t = parse(raw, opts);

    CHECK(t->data() == Dict{{"comment", "a trivial comment"}});
    CHECK_FALSE(t->comment.loaded());
    CHECK(t->comment.get() == "a trivial comment");
    CHECK(t->comment.loaded());
    CHECK(t->data().empty());
}

TEST_CASE("Metainfo: the fallback encoding is used") {
    auto t = create();
    t->data()["comment"] = BencodeValue("\xc1");

    CHECK_FALSE(t->fallbackEncoding().has_value());
    REQUIRE_THROWS_WITH(t->loadFields(), "comment: cannot decode b'\\xc1' as UTF-8");

    t->setFallbackEncoding("cp1251");
    t->loadFields();
    CHECK(t->comment.get() == kLetterBe);
}

TEST_CASE("Metainfo: encoding precedence") {
    SECTION("an explicit field encoding beats everything") {
        auto t = parse(encoded(Dict{{"encoding", "\xc1"}}), ParseOptions{.lazy = true, .fallbackEncoding = "cp1251"});
        REQUIRE_THROWS_WITH(t->encoding.get(), "encoding: cannot decode b'\\xc1' as ASCII");
    }
    SECTION("the record encoding beats the code page") {
        auto t = parse(encoded(Dict{{"encoding", "cp1252"}, {"codepage", 1251}, {"comment", "\xc1"}}));
        CHECK(t->comment.get() == "\xc3\x81");          // U+00C1
    }
    SECTION("the code page beats UTF-8") {
        auto t = parse(encoded(Dict{{"codepage", 1251}, {"comment", kLetterBe}}));
        CHECK(t->comment.get() == "\xd0\xa0\xe2\x80\x98");  // U+0420 U+2018
    }
    SECTION("a UTF-8 record encoding defers to the code page") {
        auto t = parse(encoded(Dict{{"encoding", "utf-8"}, {"codepage", 1251}, {"comment", "\xc1"}}));
        CHECK(t->comment.get() == kLetterBe);
    }
    SECTION("code page 65001 is UTF-8") {
        auto t = parse(encoded(Dict{{"codepage", 65001}, {"comment", kLetterBe}}));
        CHECK(t->comment.get() == kLetterBe);
        CHECK_FALSE(t->recordEncoding().has_value());
    }
    SECTION("UTF-8 beats the fallback encoding") {
        ParseOptions opts;
        opts.fallbackEncoding = "cp1251";
        auto t = parse(encoded(Dict{{"comment", kLetterBe}}), opts);
        CHECK(t->comment.get() == kLetterBe);
    }
}

TEST_CASE("Metainfo: context fields load before the fields that need them") {
    // "comment" is declared before "encoding".
    auto t = parse(encoded(Dict{{"comment", "\xc1"}, {"encoding", "cp1251"}}));
    CHECK(t->comment.get() == kLetterBe);
    CHECK(t->encoding.get() == "cp1251");
    CHECK(t->data().empty());
}

TEST_CASE("Metainfo: bad input is rejected") {
    CHECK(errc_of("") == DecodeErrc::Empty);
    CHECK(errc_of("d") == DecodeErrc::MissingDictTerminator);
    CHECK(errc_of("di6e4:Oopse") == DecodeErrc::UnsupportedKeyType);
    CHECK(errc_of("d1:\xff" "i1ee") == DecodeErrc::InvalidUtf8Key);

    REQUIRE_THROWS_WITH(parse("le"), "expected top-level dictionary instead of list");
    REQUIRE_THROWS_AS(parse("i1e"), ExpectedTopLevelDict);
    REQUIRE_THROWS_AS(parse("d7:privatei2ee"), RangeError);
    REQUIRE_THROWS_AS(parse("d8:announce8:hostnamee"), IllFormedUrlError);
}

TEST_CASE("Metainfo: byte keys can be kept") {
    ParseOptions opts;
    opts.keys = clot::bencode::KeyMode::textOrBytes;
    auto t = parse("d7:comment1:x1:\xff" "i1ee", opts);

    CHECK(t->comment.get() == "x");
    CHECK(t->data().containsKey(clot::bencode::DictKey::raw("\xff")));
}

TEST_CASE("Metainfo: raw byte keys are refused") {
    ParseOptions opts;
    opts.keys = clot::bencode::KeyMode::bytes;
    REQUIRE_THROWS_AS(parse("d7:comment1:xe", opts), ValueError);
    REQUIRE_THROWS_WITH(create(opts), "typed records need text keys, not KeyMode::bytes");
}

TEST_CASE("Metainfo: info hash") {
    auto none = create();
    CHECK_FALSE(none->infoHash().has_value());
    CHECK(none->infoHashHex().empty());

    auto empty = parse("d4:infodee");
    CHECK(empty->infoHashHex() == "600ccd1b71569232d01d110bc63e906beab04d8c");

    auto named = parse("d4:infod4:name1:xee");
    const auto hash = named->infoHash();
    REQUIRE(hash.has_value());
    CHECK((*hash)[0] == 0xc0);
    CHECK((*hash)[19] == 0x31);
    CHECK(named->infoHashHex() == "c06fadd1439dd2d619fec4538d69a54e614bb831");
}
