/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpkit/crypto/OtpKey.hpp"
#include "../otpkit/crypto/Encoding.hpp"
#include <catch.hpp>

TEST_CASE("RFC 4226 test vectors", "[crypto][otp]" )
{
    std::string secretData = "12345678901234567890";
    otpkit::OtpKey key(secretData);

    const char *cases[] =
    {
        "755224",
        "287082",
        "359152",
        "969429",
        "338314",
        "254676",
        "287922",
        "162583",
        "399871",
        "520489"
    };
    int i = 0;
    for (auto test: cases)
    {
        REQUIRE(key.hotp(i) == test);
        ++i;
    }
}

TEST_CASE("RFC 6238 test vectors", "[crypto][otp]" )
{
    const std::string seed = "12345678901234567890";
    const std::string seed32 = seed + "123456789012";
    const auto seed64 = otpkit::buildData({seed, seed, seed,
                                           std::string("1234")});
    REQUIRE(64 == seed64.size());

    otpkit::OtpKey sha1Key(seed);
    otpkit::OtpKey sha256Key(seed32);
    otpkit::OtpKey sha512Key(seed64);

    struct TestCase
    {
        int64_t time;
        const char *sha1;
        const char *sha256;
        const char *sha512;
    };
    TestCase cases[] =
    {
        {59,          "94287082", "46119246", "90693936"},
        {1111111109,  "07081804", "68084774", "25091201"},
        {1111111111,  "14050471", "67062674", "99943326"},
        {1234567890,  "89005924", "91819424", "93441116"},
        {2000000000,  "69279037", "90698825", "38618901"},
        {20000000000, "65353130", "77737706", "47863826"}
    };

    for (auto &test: cases)
    {
        CHECK(sha1Key.totp(test.time, 30, 8, otpkit::OtpAlgorithm::sha1) ==
              test.sha1);
        CHECK(sha256Key.totp(test.time, 30, 8, otpkit::OtpAlgorithm::sha256) ==
              test.sha256);
        CHECK(sha512Key.totp(test.time, 30, 8, otpkit::OtpAlgorithm::sha512) ==
              test.sha512);
    }
}

TEST_CASE("Leading zeros in OTP output", "[crypto][otp]" )
{
    otpkit::OtpKey key;
    REQUIRE(key.decodeBase32("AAAAAAAA"));
    REQUIRE(key.hotp(2) == "073348");
    REQUIRE(key.hotp(9) == "003773");
}

TEST_CASE("OTP digit counts", "[crypto][otp]" )
{
    otpkit::OtpKey key(std::string("12345678901234567890"));

    CHECK(key.hotp(1, 6) == "287082");
    CHECK(key.hotp(1, 7) == "4287082");
    CHECK(key.hotp(1, 8) == "94287082");
    CHECK(key.hotp(1, 9) == "094287082");
    CHECK(key.hotp(1, 10) == "1094287082");
}

TEST_CASE("TOTP time counter", "[crypto][otp]" )
{
    using otpkit::OtpKey;

    SECTION("after 1970")
    {
        CHECK(OtpKey::timeCounter(0, 30) == 0);
        CHECK(OtpKey::timeCounter(29, 30) == 0);
        CHECK(OtpKey::timeCounter(30, 30) == 1);
        CHECK(OtpKey::timeCounter(59, 1) == 59);
        CHECK(OtpKey::timeCounter(20000000000, 30) == 666666666);
    }
    SECTION("before 1970")
    {
        CHECK(OtpKey::timeCounter(-1, 30) == -1);
        CHECK(OtpKey::timeCounter(-30, 30) == -1);
        CHECK(OtpKey::timeCounter(-31, 30) == -2);
    }
    SECTION("negative counters use two's complement")
    {
        OtpKey key(std::string("12345678901234567890"));
        CHECK(key.totp(-1) == "094451");
        CHECK(key.totp(0) == "755224");
    }
}

TEST_CASE("OTP key base32 handling", "[crypto][otp]" )
{
    otpkit::OtpKey key;

    SECTION("unpadded round trip")
    {
        REQUIRE(key.decodeBase32("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZA"));
        REQUIRE(otpkit::toString(key.key()) ==
                "1234567890123456789012");
        REQUIRE(key.encodeBase32() == "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZA");
    }
    SECTION("padding is rejected")
    {
        REQUIRE_FALSE(key.decodeBase32("MY======"));
    }
    SECTION("failure leaves the key alone")
    {
        REQUIRE(key.decodeBase32("MZXW6"));
        REQUIRE_FALSE(key.decodeBase32("M1"));
        REQUIRE(otpkit::toString(key.key()) == "foo");
    }
}
