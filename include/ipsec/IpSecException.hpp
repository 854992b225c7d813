#pragma once

#include <exception>
#include <string>
#include <utility>

namespace ipsec {

class IpSecException : public std::exception {
public:
    explicit IpSecException(std::string message)
        : message_(std::move(message)) {}

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

// Thrown when an algorithm is unknown or a truncation length is outside its valid range.
class InvalidArgumentException : public IpSecException {
public:
    using IpSecException::IpSecException;
};

// Thrown when a serialized record is truncated or carries an impossible length prefix.
class ParcelException : public IpSecException {
public:
    using IpSecException::IpSecException;
};

}
