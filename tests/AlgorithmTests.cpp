#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"

using ipsec::Algorithm;
using ipsec::AlgorithmCategory;
using ipsec::AlgorithmType;

TEST_CASE("Every algorithm type resolves to its identifier", "[algorithm]") {
    for (const AlgorithmType type : Algorithm::all()) {
        const Algorithm& algorithm = Algorithm::fromType(type);
        REQUIRE(algorithm.getType() == type);
        REQUIRE(Algorithm::fromName(algorithm.getName()) == &algorithm);
    }
}

TEST_CASE("Identifiers match the kernel algorithm names", "[algorithm]") {
    REQUIRE(Algorithm::fromType(AlgorithmType::CRYPT_AES_CBC).getName() == "cbc(aes)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_MD5).getName() == "hmac(md5)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA1).getName() == "hmac(sha1)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA256).getName() == "hmac(sha256)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA384).getName() == "hmac(sha384)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA512).getName() == "hmac(sha512)");
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_CRYPT_AES_GCM).getName() == "rfc4106(gcm(aes))");
}

TEST_CASE("Unknown identifiers are not supported", "[algorithm]") {
    REQUIRE(Algorithm::fromName("") == nullptr);
    REQUIRE(Algorithm::fromName("ecb(aes)") == nullptr);
    REQUIRE(Algorithm::fromName("HMAC(SHA256)") == nullptr);
    REQUIRE(Algorithm::fromName("hmac(sha256) ") == nullptr);
    REQUIRE_FALSE(Algorithm::isTruncationLengthValid("hmac(sha224)", 128));
    REQUIRE_THROWS_AS(Algorithm::fromType(static_cast<AlgorithmType>(42)), ipsec::IpSecException);
}

TEST_CASE("Range algorithms accept their bounds and reject one past", "[algorithm]") {
    struct Range { std::string_view name; int min; int max; };
    const Range ranges[] = {
        {Algorithm::AUTH_HMAC_MD5, 96, 128},
        {Algorithm::AUTH_HMAC_SHA1, 96, 160},
        {Algorithm::AUTH_HMAC_SHA256, 96, 256},
        {Algorithm::AUTH_HMAC_SHA384, 192, 384},
        {Algorithm::AUTH_HMAC_SHA512, 256, 512},
    };

    for (const auto& range : ranges) {
        INFO(range.name);
        CHECK(Algorithm::isTruncationLengthValid(range.name, range.min));
        CHECK(Algorithm::isTruncationLengthValid(range.name, range.max));
        CHECK(Algorithm::isTruncationLengthValid(range.name, (range.min + range.max) / 2));
        CHECK_FALSE(Algorithm::isTruncationLengthValid(range.name, range.min - 1));
        CHECK_FALSE(Algorithm::isTruncationLengthValid(range.name, range.max + 1));
    }
}

TEST_CASE("Set algorithms accept only their members", "[algorithm]") {
    SECTION("AES-CBC") {
        for (const int bits : {128, 192, 256}) {
            CHECK(Algorithm::isTruncationLengthValid(Algorithm::CRYPT_AES_CBC, bits));
        }
        for (const int bits : {0, 64, 127, 129, 160, 191, 193, 255, 257, 512}) {
            CHECK_FALSE(Algorithm::isTruncationLengthValid(Algorithm::CRYPT_AES_CBC, bits));
        }
    }

    SECTION("AES-GCM") {
        for (const int bits : {64, 96, 128}) {
            CHECK(Algorithm::isTruncationLengthValid(Algorithm::AUTH_CRYPT_AES_GCM, bits));
        }
        for (const int bits : {0, 63, 65, 95, 97, 100, 127, 129, 256}) {
            CHECK_FALSE(Algorithm::isTruncationLengthValid(Algorithm::AUTH_CRYPT_AES_GCM, bits));
        }
    }
}

TEST_CASE("Algorithm metadata", "[algorithm]") {
    const auto& cbc = Algorithm::fromType(AlgorithmType::CRYPT_AES_CBC);
    REQUIRE(cbc.getCategory() == AlgorithmCategory::ENCRYPTION);
    REQUIRE(cbc.getKeyLengthsBits() == std::vector<int>{128, 192, 256});
    REQUIRE(cbc.getDefaultTruncationLengthBits() == 256);

    const auto& gcm = Algorithm::fromType(AlgorithmType::AUTH_CRYPT_AES_GCM);
    REQUIRE(gcm.getCategory() == AlgorithmCategory::AUTHENTICATED_ENCRYPTION);
    REQUIRE(gcm.getKeyLengthsBits() == std::vector<int>{160, 224, 288});
    REQUIRE(gcm.getTruncationLengthSetBits() == std::vector<int>{64, 96, 128});

    const auto& sha256 = Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA256);
    REQUIRE(sha256.getCategory() == AlgorithmCategory::AUTHENTICATION);
    REQUIRE(sha256.getTruncationLengthSetBits().empty());
    REQUIRE(sha256.getDefaultTruncationLengthBits() == 256);
    REQUIRE_FALSE(sha256.isLegacy());

    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_MD5).isLegacy());
    REQUIRE(Algorithm::fromType(AlgorithmType::AUTH_HMAC_SHA1).isLegacy());
}
