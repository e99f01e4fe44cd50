#include <catch2/catch_test_macros.hpp>
#include "attest/json_canonicalization.hpp"
#include <cmath>
#include <limits>

using namespace attest::json;
using json = nlohmann::json;

TEST_CASE("RFC 8785 - Simple object canonicalization", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("RFC 8785 - Nested object canonicalization", "[json]")
{
    json obj = {
        {"outer", {{"z", "last"}, {"a", "first"}}}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"outer":{"a":"first","z":"last"}})");
}

TEST_CASE("RFC 8785 - Keys sort by UTF-16 code units", "[json]")
{
    // U+00E9 < U+1F600 (surrogate D83D) < U+FB03 in UTF-16, unlike UTF-8 byte order
    json obj = json::object();
    obj["\xEF\xAC\x83"] = 3;
    obj["\xF0\x9F\x98\x80"] = 2;
    obj["\xC3\xA9"] = 1;

    auto canonical = RFC8785Canonicalizer::canonicalize(obj).value();
    auto e_acute = canonical.find("\xC3\xA9");
    auto emoji = canonical.find("\xF0\x9F\x98\x80");
    auto ligature = canonical.find("\xEF\xAC\x83");
    REQUIRE(e_acute < emoji);
    REQUIRE(emoji < ligature);
}

TEST_CASE("RFC 8785 - String escaping", "[json]")
{
    json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"tab", "a\tb"},
        {"slash", "a/b"}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() ==
            R"({"newline":"line1\nline2","quote":"He said \"hello\"","slash":"a/b","tab":"a\tb"})");
}

TEST_CASE("RFC 8785 - Control character escaping", "[json]")
{
    json obj = {{"ctrl", std::string("test\x01\x1F")}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj).value();
    REQUIRE(canonical == R"({"ctrl":"test\u0001\u001f"})");
}

TEST_CASE("RFC 8785 - Integer formatting", "[json]")
{
    json obj = {
        {"int", 42},
        {"negative", -17},
        {"zero", 0}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"int":42,"negative":-17,"zero":0})");
}

TEST_CASE("RFC 8785 - ECMAScript number formatting", "[json]")
{
    REQUIRE(format_es_number(0.1) == "0.1");
    REQUIRE(format_es_number(1.5) == "1.5");
    REQUIRE(format_es_number(100.0) == "100");
    REQUIRE(format_es_number(-0.0) == "0");
    REQUIRE(format_es_number(1e21) == "1e+21");
    REQUIRE(format_es_number(1e20) == "100000000000000000000");
    REQUIRE(format_es_number(1e-7) == "1e-7");
    REQUIRE(format_es_number(0.000001) == "0.000001");
    REQUIRE(format_es_number(-2.5e-10) == "-2.5e-10");
    REQUIRE(format_es_number(123.456) == "123.456");

    SECTION("integers beyond 2^53 are rendered as doubles")
    {
        json big = int64_t{9007199254740993};
        REQUIRE(RFC8785Canonicalizer::canonicalize(big).value() == "9007199254740992");
    }
}

TEST_CASE("RFC 8785 - Unrepresentable values are rejected", "[json]")
{
    REQUIRE_FALSE(RFC8785Canonicalizer::canonicalize(json(std::numeric_limits<double>::quiet_NaN())).has_value());
    REQUIRE_FALSE(RFC8785Canonicalizer::canonicalize(json(std::numeric_limits<double>::infinity())).has_value());

    auto bad_utf8 = RFC8785Canonicalizer::canonicalize(json::object({{"k", std::string("\xff\xfe")}}));
    REQUIRE_FALSE(bad_utf8.has_value());
    REQUIRE(bad_utf8.error().code == attest::ErrorCode::InvalidInput);
}

TEST_CASE("RFC 8785 - Boolean, null and empty structures", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"bool_false":false,"bool_true":true,"null_val":null})");
    REQUIRE(RFC8785Canonicalizer::canonicalize(json::object()).value() == "{}");
    REQUIRE(RFC8785Canonicalizer::canonicalize(json::array()).value() == "[]");
}

TEST_CASE("RFC 8785 - Canonical text is independent of input formatting", "[json]")
{
    auto a = RFC8785Canonicalizer::canonicalize_string(R"({ "z": 1, "a": [ 9, 8, 7 ], "nested": { "y": 3, "b": 4 } })");
    auto b = RFC8785Canonicalizer::canonicalize_string(R"({"nested":{"b":4,"y":3},"a":[9,8,7],"z":1})");

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
    REQUIRE(*a == R"({"a":[9,8,7],"nested":{"b":4,"y":3},"z":1})");

    REQUIRE_FALSE(RFC8785Canonicalizer::canonicalize_string("{not json").has_value());
}
