#include <algorithm>
#include <utility>

#include "ipsec/Algorithm.hpp"
#include "ipsec/IpSecException.hpp"

namespace ipsec {

Algorithm::Algorithm(const AlgorithmType type,
                     std::string name,
                     const AlgorithmCategory category,
                     const bool legacy,
                     const int minTruncLenBits,
                     const int maxTruncLenBits,
                     std::vector<int> truncLenSetBits,
                     std::vector<int> keyLengthsBits)
    : type_(type),
      name_(std::move(name)),
      category_(category),
      legacy_(legacy),
      minTruncLenBits_(minTruncLenBits),
      maxTruncLenBits_(maxTruncLenBits),
      truncLenSetBits_(std::move(truncLenSetBits)),
      keyLengthsBits_(std::move(keyLengthsBits)) { }

const Algorithm& Algorithm::fromType(const AlgorithmType type) {
    switch (type) {
        case AlgorithmType::CRYPT_AES_CBC: {
            static const Algorithm instance(type, std::string(CRYPT_AES_CBC),
                                            AlgorithmCategory::ENCRYPTION, false,
                                            128, 256, {128, 192, 256}, {128, 192, 256});
            return instance;
        }
        case AlgorithmType::AUTH_HMAC_MD5: {
            static const Algorithm instance(type, std::string(AUTH_HMAC_MD5),
                                            AlgorithmCategory::AUTHENTICATION, true,
                                            96, 128, {}, {});
            return instance;
        }
        case AlgorithmType::AUTH_HMAC_SHA1: {
            static const Algorithm instance(type, std::string(AUTH_HMAC_SHA1),
                                            AlgorithmCategory::AUTHENTICATION, true,
                                            96, 160, {}, {});
            return instance;
        }
        case AlgorithmType::AUTH_HMAC_SHA256: {
            static const Algorithm instance(type, std::string(AUTH_HMAC_SHA256),
                                            AlgorithmCategory::AUTHENTICATION, false,
                                            96, 256, {}, {});
            return instance;
        }
        case AlgorithmType::AUTH_HMAC_SHA384: {
            static const Algorithm instance(type, std::string(AUTH_HMAC_SHA384),
                                            AlgorithmCategory::AUTHENTICATION, false,
                                            192, 384, {}, {});
            return instance;
        }
        case AlgorithmType::AUTH_HMAC_SHA512: {
            static const Algorithm instance(type, std::string(AUTH_HMAC_SHA512),
                                            AlgorithmCategory::AUTHENTICATION, false,
                                            256, 512, {}, {});
            return instance;
        }
        case AlgorithmType::AUTH_CRYPT_AES_GCM: {
            static const Algorithm instance(type, std::string(AUTH_CRYPT_AES_GCM),
                                            AlgorithmCategory::AUTHENTICATED_ENCRYPTION, false,
                                            64, 128, {64, 96, 128}, {160, 224, 288});
            return instance;
        }
        default:
            throw IpSecException("Unknown algorithm type");
    }
}

const std::array<AlgorithmType, Algorithm::COUNT>& Algorithm::all() {
    static constexpr std::array<AlgorithmType, COUNT> types = {
        AlgorithmType::CRYPT_AES_CBC,
        AlgorithmType::AUTH_HMAC_MD5,
        AlgorithmType::AUTH_HMAC_SHA1,
        AlgorithmType::AUTH_HMAC_SHA256,
        AlgorithmType::AUTH_HMAC_SHA384,
        AlgorithmType::AUTH_HMAC_SHA512,
        AlgorithmType::AUTH_CRYPT_AES_GCM
    };
    return types;
}

const Algorithm* Algorithm::fromName(const std::string_view name) {
    for (const AlgorithmType type : all()) {
        const Algorithm& algorithm = fromType(type);
        if (algorithm.getName() == name) {
            return &algorithm;
        }
    }
    return nullptr;
}

bool Algorithm::isTruncationLengthValid(const std::string_view name, const int truncLenBits) {
    const Algorithm* algorithm = fromName(name);
    return algorithm != nullptr && algorithm->isTruncationLengthValid(truncLenBits);
}

bool Algorithm::isTruncationLengthValid(const int truncLenBits) const {
    if (!truncLenSetBits_.empty()) {
        return std::ranges::find(truncLenSetBits_, truncLenBits) != truncLenSetBits_.end();
    }
    return truncLenBits >= minTruncLenBits_ && truncLenBits <= maxTruncLenBits_;
}

}
