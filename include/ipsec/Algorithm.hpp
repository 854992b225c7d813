#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ipsec {

enum class AlgorithmType : uint8_t {
    CRYPT_AES_CBC = 0,
    AUTH_HMAC_MD5 = 1,
    AUTH_HMAC_SHA1 = 2,
    AUTH_HMAC_SHA256 = 3,
    AUTH_HMAC_SHA384 = 4,
    AUTH_HMAC_SHA512 = 5,
    AUTH_CRYPT_AES_GCM = 6
};

enum class AlgorithmCategory : uint8_t {
    ENCRYPTION,
    AUTHENTICATION,
    AUTHENTICATED_ENCRYPTION
};

// Validation rules for one of the algorithms an IPsec transform can use.
// Instances are process-wide singletons obtained through fromType() or fromName().
class Algorithm {
public:
    // AES-CBC encryption. Valid key lengths are {128, 192, 256}.
    static constexpr std::string_view CRYPT_AES_CBC = "cbc(aes)";
    // MD5 HMAC, legacy 3GPP compatibility only.
    static constexpr std::string_view AUTH_HMAC_MD5 = "hmac(md5)";
    // SHA1 HMAC, legacy 3GPP compatibility only.
    static constexpr std::string_view AUTH_HMAC_SHA1 = "hmac(sha1)";
    static constexpr std::string_view AUTH_HMAC_SHA256 = "hmac(sha256)";
    static constexpr std::string_view AUTH_HMAC_SHA384 = "hmac(sha384)";
    static constexpr std::string_view AUTH_HMAC_SHA512 = "hmac(sha512)";
    // AES-GCM per RFC 4106. Keying material is a 128, 192 or 256 bit AES key
    // followed by a 32-bit salt, so valid key lengths are {160, 224, 288}.
    static constexpr std::string_view AUTH_CRYPT_AES_GCM = "rfc4106(gcm(aes))";

    static constexpr size_t COUNT = 7;

    [[nodiscard]] static const Algorithm& fromType(AlgorithmType type);

    // Returns nullptr when the identifier is not one of the supported algorithms.
    [[nodiscard]] static const Algorithm* fromName(std::string_view name);

    // Supported algorithms in declaration order.
    [[nodiscard]] static const std::array<AlgorithmType, COUNT>& all();

    // False for unknown identifiers.
    [[nodiscard]] static bool isTruncationLengthValid(std::string_view name, int truncLenBits);

    [[nodiscard]] AlgorithmType getType() const { return type_; }
    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] AlgorithmCategory getCategory() const { return category_; }
    [[nodiscard]] bool isLegacy() const { return legacy_; }
    [[nodiscard]] int getMinTruncationLengthBits() const { return minTruncLenBits_; }
    [[nodiscard]] int getMaxTruncationLengthBits() const { return maxTruncLenBits_; }
    [[nodiscard]] int getDefaultTruncationLengthBits() const { return maxTruncLenBits_; }

    // Empty when every length in [min, max] is accepted.
    [[nodiscard]] const std::vector<int>& getTruncationLengthSetBits() const { return truncLenSetBits_; }

    // Documented keying material lengths. Not enforced on construction.
    [[nodiscard]] const std::vector<int>& getKeyLengthsBits() const { return keyLengthsBits_; }

    [[nodiscard]] bool isTruncationLengthValid(int truncLenBits) const;

private:
    Algorithm(AlgorithmType type, std::string name, AlgorithmCategory category, bool legacy,
              int minTruncLenBits, int maxTruncLenBits,
              std::vector<int> truncLenSetBits, std::vector<int> keyLengthsBits);

    AlgorithmType type_;
    std::string name_;
    AlgorithmCategory category_;
    bool legacy_;
    int minTruncLenBits_;
    int maxTruncLenBits_;
    std::vector<int> truncLenSetBits_;
    std::vector<int> keyLengthsBits_;
};

}
