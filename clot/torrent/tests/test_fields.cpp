#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <optional>
#include <string>
#include <vector>

#include "../include/layout.hpp"

using namespace clot::torrent;
using clot::bencode::BencodeValue;
using clot::bencode::Dict;
using clot::bencode::Integer;

namespace {

    // A bare record: a dictionary, its layout and a settable text context.
    class Dummy : public TextContext
    {
    public:
        explicit Dummy(Dict d = {}) : data(std::move(d)), layout(data, *this) {}

        std::optional<std::string> recordEncoding() override { return record; }
        const std::optional<std::string>& fallbackEncoding() const override { return fallback; }
        clot::logger::Logger* log() const override { return nullptr; }

        Dict data;
        Layout layout;
        std::optional<std::string> record;
        std::optional<std::string> fallback;
    };

    const std::string kLetterBe = "\xd0\x91";

    Field<Integer> int_field(fields::FieldKey k) {
        return fields::integer(std::move(k));
    }

}

TEST_CASE("FieldKey: name defaults to the key with underscores") {
    fields::FieldKey k("creation date");
    CHECK(k.key == "creation date");
    CHECK(k.name == "creation_date");
    CHECK(fields::FieldKey("publisher-url").name == "publisher_url");
    CHECK(fields::FieldKey("x", "field").name == "field");
}

TEST_CASE("Layout: fields load and save at once") {
    const auto fx = int_field({"x", "field_x"});
    const auto fy = int_field({"y", "field_y"});

    Dummy dummy({{"x", 1}, {"y", 2}});
    Attr<Integer> x(dummy.layout, fx);
    Attr<Integer> y(dummy.layout, fy);

    dummy.layout.load();
    CHECK(x.loaded());
    CHECK(y.loaded());
    CHECK(dummy.data.empty());
    CHECK(x.get() == Integer(1));
    CHECK(y.get() == Integer(2));

    Dummy other;
    Attr<Integer> ox(other.layout, fx);
    Attr<Integer> oy(other.layout, fy);
    ox = Integer(1);
    oy = Integer(2);

    CHECK(other.data.empty());
    other.layout.save();
    CHECK(other.data == Dict{{"x", 1}, {"y", 2}});
}

TEST_CASE("Attr: a missing key reads as empty") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"z", 3}});
    Attr<Integer> field(dummy.layout, f);

    CHECK_FALSE(field.loaded());
    CHECK_FALSE(field.get().has_value());
    CHECK(field.loaded());
    CHECK(dummy.data == Dict{{"z", 3}});
}

TEST_CASE("Attr: a present key loads on first read") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", 1}});
    Attr<Integer> field(dummy.layout, f);

    CHECK_FALSE(field.loaded());
    CHECK(field.get() == Integer(1));
    CHECK(dummy.data.empty());

    // A second read does not look at the dictionary again.
    dummy.data.set("x", 5);
    CHECK(field.get() == Integer(1));
}

TEST_CASE("Attr: a bad stored value fails the read and stays put") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", "1"}});
    Attr<Integer> field(dummy.layout, f);

    REQUIRE_THROWS_WITH(field.get(), "field: expected b'1' to be of type int");
    CHECK_FALSE(field.loaded());
    CHECK(dummy.data == Dict{{"x", "1"}});
}

TEST_CASE("Attr: assignment leaves the dictionary alone") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", 1}});
    Attr<Integer> field(dummy.layout, f);

    field = Integer(0);
    CHECK(field.loaded());
    CHECK(field.get() == Integer(0));
    CHECK(dummy.data == Dict{{"x", 1}});

    field = std::nullopt;
    CHECK_FALSE(field.get().has_value());
}

TEST_CASE("Attr: save updates, deletes and adds the key") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", 1}});
    Attr<Integer> field(dummy.layout, f);

    field = Integer(2);
    field.saveTo();
    CHECK(dummy.data == Dict{{"x", 2}});

    field = std::nullopt;
    field.saveTo();
    CHECK(dummy.data.empty());

    field = Integer(3);
    field.saveTo();
    CHECK(dummy.data == Dict{{"x", 3}});
}

TEST_CASE("Attr: a field never loaded is left alone on save") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", 1}});
    Attr<Integer> field(dummy.layout, f);

    field.saveTo();
    CHECK(dummy.data == Dict{{"x", 1}});
}

TEST_CASE("Integer: bounds are enforced on assignment") {
    const auto f = fields::integer({"x", "field"}, Integer(10), Integer(20));
    Dummy dummy;
    Attr<Integer> field(dummy.layout, f);

    field = Integer(10);
    field = Integer(11);
    REQUIRE_THROWS_WITH(field.set(Integer(9)), "field: expected 9 to be at least 10");
    CHECK(field.get() == Integer(11));

    field = Integer(20);
    REQUIRE_THROWS_WITH(field.set(Integer(21)), "field: expected 21 to be at most 20");
    CHECK(field.get() == Integer(20));
}

TEST_CASE("Integer: bounds are enforced on load") {
    const auto f = fields::integer({"x", "field"}, Integer(0), Integer(1));
    Dummy dummy({{"x", 2}});
    Attr<Integer> field(dummy.layout, f);

    REQUIRE_THROWS_AS(field.get(), RangeError);
    CHECK(dummy.data.contains("x"));
}

TEST_CASE("Bytes, String and Url: blank values are rejected") {
    const auto fb = fields::bytes({"b", "field"});
    const auto fs = fields::string({"s", "field"});
    const auto fu = fields::url({"u", "field"});
    Dummy dummy;
    Attr<std::string> b(dummy.layout, fb);
    Attr<std::string> s(dummy.layout, fs);
    Attr<std::string> u(dummy.layout, fu);

    b = std::string("123");
    s = std::string("123");
    u = std::string("http://example.com");

    const std::string blank = "\r \n \t \v \f";
    REQUIRE_THROWS_WITH(b.set(blank), "field: empty value is not allowed");
    REQUIRE_THROWS_AS(s.set(blank), EmptyValueError);
    REQUIRE_THROWS_AS(u.set(blank), EmptyValueError);

    CHECK(b.get() == "123");
    CHECK(s.get() == "123");
    CHECK(u.get() == "http://example.com");
}

TEST_CASE("Bytes: any byte string is kept as is") {
    const auto f = fields::bytes({"x", "field"});
    const std::string raw("\xff\x00\x01", 3);
    Dummy dummy({{"x", raw}});
    Attr<std::string> field(dummy.layout, f);
    CHECK(field.get() == raw);

    field.saveTo();
    CHECK(dummy.data.find("x")->isBytes());
}

TEST_CASE("String: bad storage fails the read") {
    const auto f = fields::string({"x", "field"});

    SECTION("wrong kind") {
        Dummy dummy({{"x", 1}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: expected 1 to be of type bytes");
    }
    SECTION("undecodable bytes") {
        Dummy dummy({{"x", "\xc1"}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: cannot decode b'\\xc1' as UTF-8");
        REQUIRE_THROWS_AS(field.get(), TextDecodeError);
    }
    SECTION("assigned text must be UTF-8") {
        Dummy dummy;
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.set(std::string("\xc1")), "field: the value b'\\xc1' is not UTF-8 text");
    }
}

TEST_CASE("String: an explicit encoding is used") {
    const auto normal = fields::string({"x", "normal_field"});
    const auto expl = fields::string({"y", "explicit_field"}, "ASCII");

    Dummy dummy({{"x", kLetterBe}, {"y", kLetterBe}});
    Attr<std::string> normalField(dummy.layout, normal);
    Attr<std::string> explicitField(dummy.layout, expl);

    CHECK(normalField.get() == kLetterBe);
    REQUIRE_THROWS_WITH(explicitField.get(), "explicit_field: cannot decode b'\\xd0\\x91' as ASCII");
}

TEST_CASE("String: the fallback encoding is tried after UTF-8") {
    const auto f = fields::string({"x", "field"});
    Dummy dummy({{"x", "\xc1"}});
    dummy.fallback = "cp1251";
    Attr<std::string> field(dummy.layout, f);

    CHECK(field.get() == kLetterBe);

    field.saveTo();
    const auto* stored = dummy.data.find("x");
    REQUIRE(stored);
    CHECK(stored->isText());
    CHECK(stored->asString() == kLetterBe);
}

TEST_CASE("Url: ill-formed values fail the read") {
    SECTION("wrong kind") {
        const auto f = fields::url({"x", "field"});
        Dummy dummy({{"x", 1}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: expected 1 to be of type bytes");
    }
    SECTION("unexpected scheme") {
        const auto f = fields::url({"x", "field"});
        Dummy dummy({{"x", "http2://hostname"}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: the value 'http2://hostname' is ill-formed (unexpected scheme)");
    }
    SECTION("scheme not in the allowed set") {
        const auto f = fields::url({"x", "field"}, {"ftp"});
        Dummy dummy({{"x", "http://hostname"}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: the value 'http://hostname' is ill-formed (unexpected scheme)");
    }
    SECTION("missing scheme") {
        const auto f = fields::url({"x", "field"}, {});
        Dummy dummy({{"x", "hostname"}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: the value 'hostname' is ill-formed (missing scheme)");
    }
    SECTION("missing hostname") {
        const auto f = fields::url({"x", "field"});
        Dummy dummy({{"x", "http://:20"}});
        Attr<std::string> field(dummy.layout, f);
        REQUIRE_THROWS_WITH(field.get(), "field: the value 'http://:20' is ill-formed (missing hostname)");
    }
}

TEST_CASE("Url: well-formed values are accepted") {
    const auto ftp = fields::url({"x", "field"}, {"ftp"});
    const auto web = fields::url({"x", "field"});

    for (const std::string value : {"https://hostname", "http://hostname:123", "udp://hostname"}) {
        Dummy dummy({{"x", value}});
        Attr<std::string> field(dummy.layout, web);
        CHECK(field.get() == value);
    }

    Dummy dummy({{"x", "ftp://hostname"}});
    Attr<std::string> field(dummy.layout, ftp);
    CHECK(field.get() == "ftp://hostname");
}

TEST_CASE("Timestamp: bad storage fails the read") {
    const auto f = fields::timestamp({"x", "field"});

    Dummy bytes({{"x", "1"}});
    Attr<Timestamp> a(bytes.layout, f);
    REQUIRE_THROWS_WITH(a.get(), "field: expected b'1' to be of type int");

    Dummy huge({{"x", 100000000000LL}});
    Attr<Timestamp> b(huge.layout, f);
    REQUIRE_THROWS_WITH(b.get(), "field: cannot convert 100000000000 to a timestamp");
}

TEST_CASE("Timestamp: assigned values need an offset") {
    using namespace std::chrono;
    const auto f = fields::timestamp({"x", "field"});
    Dummy dummy;
    Attr<Timestamp> field(dummy.layout, f);

    field = Timestamp::fromUnix(12, hours{3});
    REQUIRE_THROWS_WITH(field.set(Timestamp::naive(sys_days{year{2000} / January / 1})),
                        "field: the value 2000-01-01T00:00:00 is missing timezone info");

    field.saveTo();
    CHECK(dummy.data == Dict{{"x", 12}});
    CHECK(field.displayText() == "1970-01-01T03:00:12+03:00");
}

TEST_CASE("Timestamp: assigned values outside the epoch range are rejected") {
    using namespace std::chrono;
    const auto f = fields::timestamp({"x", "field"});
    Dummy dummy;
    Attr<Timestamp> field(dummy.layout, f);

    field = Timestamp::fromUnix(validators::kMaxEpoch);
    REQUIRE_THROWS_AS(field.set(Timestamp::fromUnix(-1)), ConversionError);
    REQUIRE_THROWS_WITH(field.set(Timestamp::fromUnix(validators::kMaxEpoch + 1)),
                        "field: cannot convert 32535216000 to a timestamp");
    REQUIRE_THROWS_WITH(field.set(Timestamp::fromUnix(-86400, hours{2})),
                        "field: cannot convert -86400 to a timestamp");
    CHECK(field.get()->toUnix() == validators::kMaxEpoch);

    // What the field saves, it reads back.
    field.saveTo();
    Dummy reread(dummy.data);
    Attr<Timestamp> again(reread.layout, f);
    CHECK(again.get()->toUnix() == validators::kMaxEpoch);
}

TEST_CASE("UrlList: bare URL, list and adoption") {
    const auto f = fields::urlList({"url-list", "url_list"});

    Dummy bare({{"url-list", "http://mirror.com/pub"}});
    Attr<List<std::string>> a(bare.layout, f);
    CHECK(*a.get() == std::vector<std::string>{"http://mirror.com/pub"});

    Dummy many({{"url-list", BencodeValue::List{BencodeValue("http://a.com"), BencodeValue("http://b.com")}}});
    Attr<List<std::string>> b(many.layout, f);
    CHECK(*b.get() == std::vector<std::string>{"http://a.com", "http://b.com"});

    // Items added later still go through the URL check.
    auto urls = *b.get();
    REQUIRE_THROWS_AS(urls.append("not a url"), IllFormedUrlError);

    // A foreign list is rebuilt around the field's own check.
    List<std::string> loose([](const std::string& s) { return s; }, {"http://c.com"});
    b = loose;
    CHECK(b.get()->sharesValidator(urls));
    REQUIRE_THROWS_AS(b.set(List<std::string>([](const std::string& s) { return s; }, {"nope"})), IllFormedUrlError);
}

TEST_CASE("NodeList: pairs become host:port text") {
    const auto f = fields::nodeList("nodes");
    Dummy dummy({{"nodes", BencodeValue::List{
        BencodeValue(BencodeValue::List{BencodeValue("host-a"), BencodeValue(123)}),
        BencodeValue(BencodeValue::List{BencodeValue("host-b"), BencodeValue(456)}),
    }}});
    Attr<List<std::string>> nodes(dummy.layout, f);

    CHECK(*nodes.get() == std::vector<std::string>{"host-a:123", "host-b:456"});

    Dummy bad({{"nodes", BencodeValue::List{BencodeValue(BencodeValue::List{BencodeValue("h"), BencodeValue(0)})}}});
    Attr<List<std::string>> badNodes(bad.layout, f);
    REQUIRE_THROWS_AS(badNodes.get(), InvalidNodeError);
    CHECK(bad.data.contains("nodes"));
}

TEST_CASE("Layout: context fields load first") {
    // The text field reads the record encoding from the context field
    // declared after it.
    const auto text = fields::string({"t", "text"});
    const auto enc = fields::as_context(fields::string({"e", "enc"}, "ASCII"));

    struct Record : Dummy
    {
        using Dummy::Dummy;
        std::optional<std::string> recordEncoding() override { return encoding ? encoding->get() : std::nullopt; }
        Attr<std::string>* encoding{nullptr};
    };

    Record rec({{"t", "\xc1"}, {"e", "cp1251"}});
    Attr<std::string> t(rec.layout, text);
    Attr<std::string> e(rec.layout, enc);
    rec.encoding = &e;

    rec.layout.load();
    CHECK(e.consumed());
    CHECK(t.get() == kLetterBe);
    CHECK(e.get() == "cp1251");
    CHECK(rec.data.empty());
}

TEST_CASE("Layout: a field pulled in early is not loaded twice") {
    const auto text = fields::string({"t", "text"});
    const auto enc = fields::string({"e", "enc"}, "ASCII");     // not marked as context

    struct Record : Dummy
    {
        using Dummy::Dummy;
        std::optional<std::string> recordEncoding() override { return encoding ? encoding->get() : std::nullopt; }
        Attr<std::string>* encoding{nullptr};
    };

    Record rec({{"t", "\xc1"}, {"e", "cp1251"}});
    Attr<std::string> t(rec.layout, text);
    Attr<std::string> e(rec.layout, enc);
    rec.encoding = &e;

    // t loads first and reads e on the way; e's key is gone by its turn.
    rec.layout.load();
    CHECK(t.get() == kLetterBe);
    CHECK(e.get() == "cp1251");

    // A second pass reads the dictionary afresh, the early field included.
    rec.data.set("t", "\xc1");
    rec.data.set("e", "koi8-r");
    rec.layout.load();
    CHECK(t.get() == "\xd0\xb0");     // U+0430
    CHECK(e.get() == "koi8-r");
    CHECK(rec.data.empty());
}

TEST_CASE("Layout: a key removed before a reload empties its field") {
    const auto f = int_field({"x", "field"});
    Dummy dummy({{"x", 1}});
    Attr<Integer> field(dummy.layout, f);

    dummy.layout.load();
    CHECK(field.get() == Integer(1));

    dummy.layout.save();
    CHECK(dummy.data == Dict{{"x", 1}});
    dummy.data.erase("x");

    dummy.layout.load();
    CHECK(field.loaded());
    CHECK_FALSE(field.get().has_value());

    dummy.layout.save();
    CHECK(dummy.data.empty());
}
