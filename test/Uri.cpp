/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpkit/util/Uri.hpp"
#include <catch.hpp>

using otpkit::Uri;

TEST_CASE("Key URI components", "[util][uri]")
{
    Uri uri;
    REQUIRE(uri.decode("otpauth://totp/Example:alice@google.com"
                       "?secret=JBSWY3DPEHPK3PXP&issuer=Example#top"));

    CHECK(uri.scheme() == "otpauth");
    CHECK(uri.authorityOk());
    CHECK(uri.authority() == "totp");
    CHECK(uri.path() == "/Example:alice@google.com");
    CHECK(uri.queryOk());
    CHECK(uri.query() == "secret=JBSWY3DPEHPK3PXP&issuer=Example");
    CHECK(uri.fragmentOk());
    CHECK(uri.fragment() == "top");
}

TEST_CASE("Percent escapes in every component", "[util][uri]")
{
    Uri uri;
    REQUIRE(uri.decode("Otp%41uth:%2Fa%2f?%3D#%7E") == false);
    REQUIRE(uri.decode("OtpAuth:%2Fa%2f?%3D#%7E"));

    CHECK(uri.scheme() == "OtpAuth");
    CHECK_FALSE(uri.authorityOk());
    CHECK(uri.path() == "/a/");
    CHECK(uri.query() == "=");
    CHECK(uri.fragment() == "~");
}

TEST_CASE("URI scheme rules", "[util][uri]")
{
    Uri uri;

    SECTION("rejected")
    {
        CHECK_FALSE(uri.decode(""));
        CHECK_FALSE(uri.decode("otpauth"));
        CHECK_FALSE(uri.decode("://totp/x"));
        CHECK_FALSE(uri.decode("9otp://totp/x"));
        CHECK_FALSE(uri.decode("otp_auth://totp/x"));
    }
    SECTION("accepted")
    {
        REQUIRE(uri.decode("otp+x.y-z:"));
        CHECK(uri.scheme() == "otp+x.y-z");
        CHECK(uri.path() == "");
    }
    SECTION("only the first colon ends the scheme")
    {
        REQUIRE(uri.decode("otpauth::totp"));
        CHECK(uri.scheme() == "otpauth");
        CHECK(uri.path() == ":totp");
    }
}

TEST_CASE("URI authority rules", "[util][uri]")
{
    Uri uri;

    SECTION("absent")
    {
        REQUIRE(uri.decode("otpauth:totp/alice"));
        CHECK_FALSE(uri.authorityOk());
        CHECK(uri.authority() == "");
        CHECK(uri.path() == "totp/alice");

        REQUIRE(uri.decode("otpauth:/totp//alice"));
        CHECK_FALSE(uri.authorityOk());
        CHECK(uri.path() == "/totp//alice");
    }
    SECTION("empty")
    {
        REQUIRE(uri.decode("otpauth://"));
        CHECK(uri.authorityOk());
        CHECK(uri.authority() == "");
        CHECK(uri.path() == "");

        REQUIRE(uri.decode("otpauth:///alice"));
        CHECK(uri.authorityOk());
        CHECK(uri.authority() == "");
        CHECK(uri.path() == "/alice");
    }
    SECTION("user and port stay in the authority")
    {
        REQUIRE(uri.decode("otpauth://me@totp:8080/alice"));
        CHECK(uri.authority() == "me@totp:8080");
        CHECK(uri.path() == "/alice");
    }
    SECTION("escapes are kept in the raw form")
    {
        REQUIRE(uri.decode("otpauth://tot%70/alice"));
        CHECK(uri.authority() == "totp");
        CHECK(uri.authorityRaw() == "tot%70");
    }
    SECTION("ends at a query")
    {
        REQUIRE(uri.decode("otpauth://totp?secret=A"));
        CHECK(uri.authority() == "totp");
        CHECK(uri.path() == "");
        CHECK(uri.query() == "secret=A");
    }
}

TEST_CASE("URI query and fragment markers", "[util][uri]")
{
    Uri uri;

    REQUIRE(uri.decode("otpauth://totp/a"));
    CHECK_FALSE(uri.queryOk());
    CHECK_FALSE(uri.fragmentOk());

    REQUIRE(uri.decode("otpauth://totp/a?"));
    CHECK(uri.queryOk());
    CHECK(uri.query() == "");
    CHECK_FALSE(uri.fragmentOk());

    // A '?' after the '#' belongs to the fragment:
    REQUIRE(uri.decode("otpauth://totp/a#x?secret=A"));
    CHECK_FALSE(uri.queryOk());
    CHECK(uri.fragmentOk());
    CHECK(uri.fragment() == "x?secret=A");
}

TEST_CASE("Strict and lenient decoding", "[util][uri]")
{
    Uri uri;

    SECTION("strict mode rejects unescaped specials")
    {
        CHECK_FALSE(uri.decode("otpauth://totp/ACME Co:alice"));
        CHECK_FALSE(uri.decode("otpauth://totp/a?issuer=\xc3\xa9"));
        CHECK_FALSE(uri.decode("otpauth://to[p]/a"));
    }
    SECTION("lenient mode accepts them")
    {
        REQUIRE(uri.decode("otpauth://totp/ACME Co:alice?issuer=ACME Co",
                           false));
        CHECK(uri.path() == "/ACME Co:alice");
        CHECK(uri.queryDecode()["issuer"] == "ACME Co");

        REQUIRE(uri.decode("otpauth://totp/\xc3\xa9t\xc3\xa9", false));
        CHECK(uri.path() == "/\xc3\xa9t\xc3\xa9");
    }
    SECTION("lenient mode still rejects broken escapes")
    {
        CHECK_FALSE(uri.decode("otpauth://totp/%zz", false));
        CHECK_FALSE(uri.decode("otpauth://totp/a?secret=%4", false));
        CHECK_FALSE(uri.decode("otpauth://totp/a#%", false));
    }
    SECTION("lenient mode still rejects control characters")
    {
        CHECK_FALSE(uri.decode("otpauth://totp/a\nb", false));
        CHECK_FALSE(uri.decode("otpauth://to\ttp/a", false));
        CHECK_FALSE(uri.decode("otpauth://totp/a?x=\x7f", false));
    }
}

TEST_CASE("Query parameter decoding", "[util][uri]")
{
    Uri uri;

    SECTION("empty keys and values")
    {
        REQUIRE(uri.decode("otpauth://totp/a?&&secret=A&issuer"));
        auto map = uri.queryDecode();
        CHECK(map.size() == 3);
        CHECK(map.count(""));
        CHECK(map["secret"] == "A");
        CHECK(map.count("issuer"));
        CHECK(map["issuer"] == "");
        CHECK_FALSE(map.count("A"));
    }
    SECTION("only the first '=' splits")
    {
        REQUIRE(uri.decode("otpauth://totp/a?secret=AB==C"));
        CHECK(uri.queryDecode()["secret"] == "AB==C");
    }
    SECTION("escapes and plus signs")
    {
        REQUIRE(uri.decode("otpauth://totp/a?issuer=ACME+Co"
                           "&lab%65l=a%26b%3Dc%2B"));
        auto map = uri.queryDecode();
        CHECK(map["issuer"] == "ACME Co");
        CHECK(map["label"] == "a&b=c+");
    }
    SECTION("the last repeated key wins")
    {
        REQUIRE(uri.decode("otpauth://totp/a?digits=6&period=60&digits=8"));
        auto map = uri.queryDecode();
        CHECK(map.size() == 2);
        CHECK(map["digits"] == "8");
    }
    SECTION("no query")
    {
        REQUIRE(uri.decode("otpauth://totp/a"));
        CHECK(uri.queryDecode().empty());
    }
}
