#pragma once

#include <ipsec/Algorithm.hpp>
#include <ipsec/IpSecAlgorithm.hpp>
// These includes are used by the tests. IDE does not recognize this.
// ReSharper disable CppUnusedIncludeDirective
#include <ipsec/IpSecException.hpp>
#include <ipsec/Parcel.hpp>
// ReSharper restore CppUnusedIncludeDirective
#include <cstdint>
#include <string>
#include <vector>

namespace ipsec::test {

inline std::vector<uint8_t> createTestKey(const size_t lengthBytes) {
    std::vector<uint8_t> key(lengthBytes, 0);
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(0xA0 + i);
    }
    return key;
}

// Enough key material for the longest truncation length of any algorithm.
inline std::vector<uint8_t> createMaxLengthKey() {
    return createTestKey(64);
}

inline IpSecAlgorithm roundTrip(const IpSecAlgorithm& algorithm) {
    Parcel out;
    algorithm.writeToParcel(out);
    auto in = Parcel::unmarshall(out.marshall());
    return IpSecAlgorithm::createFromParcel(in);
}

}
