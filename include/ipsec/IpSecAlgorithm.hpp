#pragma once

#include "ipsec/Algorithm.hpp"
#include "ipsec/Diagnostics.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ipsec {

class Parcel;

// A single algorithm, with its key and truncation length, that an IPsec transform can apply.
// Immutable and threadsafe. The key is copied in and copied out, never shared.
class IpSecAlgorithm {
public:
    // Truncation length defaults to the full key length in bits.
    IpSecAlgorithm(std::string_view name, std::span<const uint8_t> key);

    // Throws InvalidArgumentException if the name is not a supported algorithm or
    // truncLenBits is outside its valid range. The stored length is clamped to the key length.
    IpSecAlgorithm(std::string_view name, std::span<const uint8_t> key, int truncLenBits);

    ~IpSecAlgorithm();

    IpSecAlgorithm(const IpSecAlgorithm&) = default;
    IpSecAlgorithm(IpSecAlgorithm&&) noexcept = default;
    IpSecAlgorithm& operator=(const IpSecAlgorithm& other);
    IpSecAlgorithm& operator=(IpSecAlgorithm&& other) noexcept;

    // Reads a record written by writeToParcel(). The record is trusted: the name and
    // truncation length are not validated again.
    [[nodiscard]] static IpSecAlgorithm createFromParcel(Parcel& in);

    void writeToParcel(Parcel& out) const;

    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] std::vector<uint8_t> getKey() const { return key_; }
    [[nodiscard]] int getTruncationLengthBits() const { return truncLenBits_; }

    // Empty when the name came from a trusted record and is not a supported algorithm.
    [[nodiscard]] std::optional<AlgorithmType> getType() const;

    [[nodiscard]] std::string toString(SecretDisclosure disclosure) const;
    [[nodiscard]] std::string toString() const { return toString(defaultSecretDisclosure()); }

    [[nodiscard]] bool operator==(const IpSecAlgorithm& other) const;

    // Null compares equal only to null.
    [[nodiscard]] static bool equals(const IpSecAlgorithm* lhs, const IpSecAlgorithm* rhs);

private:
    struct TrustedRecord {};

    IpSecAlgorithm(TrustedRecord, std::string name, std::vector<uint8_t> key, int truncLenBits);

    void wipeKey();

    std::string name_;
    std::vector<uint8_t> key_;
    int truncLenBits_;
};

std::ostream& operator<<(std::ostream& os, const IpSecAlgorithm& algorithm);

}
