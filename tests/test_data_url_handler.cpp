#include <catch2/catch_all.hpp>
#include <string>
#include <vector>
#include "handlers/DataUrlHandler.hpp"

using namespace MdResource;

namespace {

ReadResult Read(const std::string& text) {
    auto url = Url::Parse(text);
    REQUIRE(url.has_value());
    return DataUrlHandler().ReadResource(*url);
}

std::string AsString(const MimeData& data) {
    return std::string(data.data.begin(), data.data.end());
}

} // anonymous namespace

TEST_CASE("DataUrlHandler decodes base64 payloads") {
    auto result = Read("data:image/png;base64,iVBORw0KGgo=");
    REQUIRE(result.Ok());
    CHECK(result.Data().MimeTypeEssence() == std::optional<std::string>("image/png"));
    CHECK(result.Data().data == std::vector<std::uint8_t>{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A});
}

TEST_CASE("DataUrlHandler percent-decodes plain payloads") {
    auto result = Read("data:text/plain;charset=utf-8,hello%20world");
    REQUIRE(result.Ok());
    CHECK(AsString(result.Data()) == "hello world");
    REQUIRE(result.Data().mime_type.has_value());
    CHECK(result.Data().mime_type->Param("charset") == std::optional<std::string>("utf-8"));
}

TEST_CASE("DataUrlHandler defaults to US-ASCII text") {
    auto result = Read("data:,abc");
    REQUIRE(result.Ok());
    CHECK(AsString(result.Data()) == "abc");
    CHECK(result.Data().MimeTypeEssence() == std::optional<std::string>("text/plain"));
    CHECK(result.Data().mime_type->Param("charset") == std::optional<std::string>("US-ASCII"));

    auto charset_only = Read("data:;charset=utf-8,x");
    REQUIRE(charset_only.Ok());
    CHECK(charset_only.Data().MimeTypeEssence() == std::optional<std::string>("text/plain"));
    CHECK(charset_only.Data().mime_type->Param("charset") == std::optional<std::string>("utf-8"));
}

TEST_CASE("DataUrlHandler keeps parameters after a quoted separator") {
    auto result = Read("data:text/plain;title=\"a;b\";charset=utf-8,x");
    REQUIRE(result.Ok());
    REQUIRE(result.Data().mime_type.has_value());
    CHECK(result.Data().mime_type->Param("charset") == std::optional<std::string>("utf-8"));
    CHECK(result.Data().mime_type->Param("title") == std::optional<std::string>("a;b"));
}

TEST_CASE("DataUrlHandler ignores the fragment") {
    auto result = Read("data:,abc#frag");
    REQUIRE(result.Ok());
    CHECK(AsString(result.Data()) == "abc");
}

TEST_CASE("DataUrlHandler rejects malformed data URLs") {
    auto no_comma = Read("data:text/plain;base64");
    REQUIRE_FALSE(no_comma.Ok());
    CHECK(no_comma.Error().kind == ResourceErrorKind::InvalidData);

    auto bad_base64 = Read("data:;base64,@@@@");
    REQUIRE_FALSE(bad_base64.Ok());
    CHECK(bad_base64.Error().kind == ResourceErrorKind::InvalidData);
}

TEST_CASE("DataUrlHandler declines other schemes") {
    CHECK(Read("file:///tmp/x.png").IsUnsupported());
    CHECK(Read("https://example.com/x.png").IsUnsupported());
}

TEST_CASE("DecodeBase64 is forgiving about padding and whitespace") {
    using DataUrlUtil::DecodeBase64;
    const std::vector<std::uint8_t> hi{'h', 'i'};
    for (const char* encoded : {"aGk=", "aGk", "aG\nk=", " aGk= "}) {
        auto decoded = DecodeBase64(encoded);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == hi);
    }
    auto empty = DecodeBase64("");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
    CHECK_FALSE(DecodeBase64("a").has_value());
    CHECK_FALSE(DecodeBase64("a===").has_value());
}
