#include "ipsec/Parcel.hpp"
#include "ipsec/IpSecException.hpp"
#include "ipsec/Log.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <bit>
#include <limits>
#include <utility>

namespace ipsec {

static constexpr size_t INT_FIELD_LENGTH = 4;

namespace {

// Converts in both directions.
uint32_t swapBigEndian(const uint32_t value) {
    if constexpr (std::endian::native == std::endian::little) {
        return __builtin_bswap32(value);
    } else {
        return value;
    }
}

}

Parcel::Parcel(Parcel&& other) noexcept
    : data_(std::move(other.data_)),
      position_(std::exchange(other.position_, 0)) {
}

Parcel& Parcel::operator=(Parcel&& other) noexcept {
    if (this != &other) {
        wipe();
        data_ = std::move(other.data_);
        position_ = std::exchange(other.position_, 0);
    }
    return *this;
}

Parcel::~Parcel() {
    wipe();
}

Parcel Parcel::unmarshall(const std::span<const uint8_t> data) {
    Parcel parcel;
    parcel.data_.assign(data.begin(), data.end());
    return parcel;
}

void Parcel::writeInt(const int32_t value) {
    const uint32_t valueBE = swapBigEndian(static_cast<uint32_t>(value));
    append(reinterpret_cast<const uint8_t*>(&valueBE), INT_FIELD_LENGTH);
}

void Parcel::writeString(const std::string_view value) {
    writeLength(value.size());
    append(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void Parcel::writeByteArray(const std::span<const uint8_t> value) {
    writeLength(value.size());
    append(value.data(), value.size());
}

int32_t Parcel::readInt() {
    require(INT_FIELD_LENGTH, "int");
    uint32_t valueBE = 0;
    std::copy_n(data_.data() + position_, INT_FIELD_LENGTH, reinterpret_cast<uint8_t*>(&valueBE));
    position_ += INT_FIELD_LENGTH;
    return static_cast<int32_t>(swapBigEndian(valueBE));
}

std::string Parcel::readString() {
    const size_t length = readLength();
    require(length, "string");
    const auto* begin = reinterpret_cast<const char*>(data_.data() + position_);
    std::string value(begin, length);
    position_ += length;
    return value;
}

std::vector<uint8_t> Parcel::readByteArray() {
    const size_t length = readLength();
    require(length, "byte array");
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(position_);
    std::vector value(begin, begin + static_cast<std::ptrdiff_t>(length));
    position_ += length;
    return value;
}

void Parcel::setDataPosition(const size_t position) {
    if (position > data_.size()) {
        throw ParcelException("Data position " + std::to_string(position) +
                              " is beyond parcel size " + std::to_string(data_.size()));
    }
    position_ = position;
}

void Parcel::append(const uint8_t* bytes, const size_t length) {
    if (length == 0) {
        return;
    }
    const size_t required = data_.size() + length;
    if (required > data_.capacity()) {
        std::vector<uint8_t> grown;
        grown.reserve(std::max(required, data_.capacity() * 2));
        grown.assign(data_.begin(), data_.end());
        wipe();
        data_.swap(grown);
    }
    data_.insert(data_.end(), bytes, bytes + length);
}

void Parcel::wipe() noexcept {
    if (!data_.empty()) {
        OPENSSL_cleanse(data_.data(), data_.size());
    }
}

void Parcel::writeLength(const size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw ParcelException("Field of " + std::to_string(length) + " bytes is too large for a parcel");
    }
    writeInt(static_cast<int32_t>(length));
}

size_t Parcel::readLength() {
    const int32_t length = readInt();
    if (length < 0) {
        log::get()->warn("Rejecting parcel with negative length prefix {} at offset {}",
                         length, position_ - INT_FIELD_LENGTH);
        throw ParcelException("Negative length prefix in parcel");
    }
    return static_cast<size_t>(length);
}

void Parcel::require(const size_t length, const char* field) const {
    if (length > dataAvail()) {
        log::get()->warn("Truncated parcel: {} needs {} bytes at offset {}, {} available",
                         field, length, position_, dataAvail());
        throw ParcelException(std::string("Parcel truncated while reading ") + field);
    }
}

}
