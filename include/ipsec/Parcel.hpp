#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ipsec {

// Length-prefixed record buffer. Writes append, reads consume from the current position.
// Integers and length prefixes are 32-bit big endian on every host. Not thread safe.
// Buffers are wiped before they are released since records carry key material.
class Parcel {
public:
    Parcel() = default;
    ~Parcel();

    Parcel(const Parcel&) = delete;
    Parcel& operator=(const Parcel&) = delete;
    Parcel(Parcel&& other) noexcept;
    Parcel& operator=(Parcel&& other) noexcept;

    // Wraps bytes produced by marshall() for reading.
    [[nodiscard]] static Parcel unmarshall(std::span<const uint8_t> data);

    void writeInt(int32_t value);
    void writeString(std::string_view value);
    void writeByteArray(std::span<const uint8_t> value);

    [[nodiscard]] int32_t readInt();
    [[nodiscard]] std::string readString();
    [[nodiscard]] std::vector<uint8_t> readByteArray();

    [[nodiscard]] const std::vector<uint8_t>& marshall() const { return data_; }
    [[nodiscard]] size_t dataSize() const { return data_.size(); }
    [[nodiscard]] size_t dataPosition() const { return position_; }
    [[nodiscard]] size_t dataAvail() const { return data_.size() - position_; }

    void setDataPosition(size_t position);

private:
    // Grows through a fresh buffer so the old one can be wiped before it is released.
    void append(const uint8_t* bytes, size_t length);
    void wipe() noexcept;
    void writeLength(size_t length);
    [[nodiscard]] size_t readLength();
    void require(size_t length, const char* field) const;

    std::vector<uint8_t> data_;
    size_t position_ = 0;
};

}
