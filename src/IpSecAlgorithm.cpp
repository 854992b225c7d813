#include <algorithm>
#include <limits>
#include <utility>

#include "ipsec/IpSecAlgorithm.hpp"
#include "ipsec/IpSecException.hpp"
#include "ipsec/Log.hpp"
#include "ipsec/Parcel.hpp"
#include "HexString.hpp"
#include <openssl/crypto.h>

namespace ipsec {

namespace {

int keyLengthBits(const std::span<const uint8_t> key) {
    constexpr auto maxBytes = static_cast<size_t>(std::numeric_limits<int>::max() / 8);
    return static_cast<int>(std::min(key.size(), maxBytes) * 8);
}

}

IpSecAlgorithm::IpSecAlgorithm(const std::string_view name, const std::span<const uint8_t> key)
    : IpSecAlgorithm(name, key, keyLengthBits(key)) {
}

IpSecAlgorithm::IpSecAlgorithm(
    const std::string_view name,
    const std::span<const uint8_t> key,
    const int truncLenBits)
    : name_(name),
      key_(key.begin(), key.end()),
      truncLenBits_(std::min(truncLenBits, keyLengthBits(key))) {

    if (!Algorithm::isTruncationLengthValid(name, truncLenBits)) {
        log::get()->debug("Rejected algorithm '{}' with truncation length {}", name, truncLenBits);
        wipeKey();
        throw InvalidArgumentException("Unknown algorithm or invalid length");
    }
}

IpSecAlgorithm::IpSecAlgorithm(
    TrustedRecord,
    std::string name,
    std::vector<uint8_t> key,
    const int truncLenBits)
    : name_(std::move(name)),
      key_(std::move(key)),
      truncLenBits_(truncLenBits) {
}

IpSecAlgorithm::~IpSecAlgorithm() {
    wipeKey();
}

IpSecAlgorithm& IpSecAlgorithm::operator=(const IpSecAlgorithm& other) {
    if (this != &other) {
        wipeKey();
        name_ = other.name_;
        key_ = other.key_;
        truncLenBits_ = other.truncLenBits_;
    }
    return *this;
}

IpSecAlgorithm& IpSecAlgorithm::operator=(IpSecAlgorithm&& other) noexcept {
    if (this != &other) {
        wipeKey();
        name_ = std::move(other.name_);
        key_ = std::move(other.key_);
        truncLenBits_ = other.truncLenBits_;
    }
    return *this;
}

IpSecAlgorithm IpSecAlgorithm::createFromParcel(Parcel& in) {
    std::string name = in.readString();
    std::vector<uint8_t> key = in.readByteArray();
    const int truncLenBits = in.readInt();
    return {TrustedRecord{}, std::move(name), std::move(key), truncLenBits};
}

void IpSecAlgorithm::writeToParcel(Parcel& out) const {
    out.writeString(name_);
    out.writeByteArray(key_);
    out.writeInt(truncLenBits_);
}

std::optional<AlgorithmType> IpSecAlgorithm::getType() const {
    if (const Algorithm* algorithm = Algorithm::fromName(name_)) {
        return algorithm->getType();
    }
    return std::nullopt;
}

std::string IpSecAlgorithm::toString(const SecretDisclosure disclosure) const {
    std::string result = "{mName=";
    result += name_;
    result += ", mKey=";
    result += disclosure == SecretDisclosure::Revealed ? toHexString(key_) : "<hidden>";
    result += ", mTruncLenBits=";
    result += std::to_string(truncLenBits_);
    result += "}";
    return result;
}

bool IpSecAlgorithm::operator==(const IpSecAlgorithm& other) const {
    if (name_ != other.name_ || truncLenBits_ != other.truncLenBits_) {
        return false;
    }
    if (key_.size() != other.key_.size()) {
        return false;
    }
    return key_.empty() || CRYPTO_memcmp(key_.data(), other.key_.data(), key_.size()) == 0;
}

bool IpSecAlgorithm::equals(const IpSecAlgorithm* lhs, const IpSecAlgorithm* rhs) {
    if (lhs == nullptr || rhs == nullptr) {
        return lhs == rhs;
    }
    return *lhs == *rhs;
}

void IpSecAlgorithm::wipeKey() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

std::ostream& operator<<(std::ostream& os, const IpSecAlgorithm& algorithm) {
    return os << algorithm.toString();
}

}
