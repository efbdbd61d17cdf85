#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "metaconf/err/msg.h"

namespace metaconf {
// A read of the input past its end, or a short read. The codec rethrows
// it as a DecodeError at the position of the value being decoded.
class NotEnoughRoom: public std::exception {
private:
    std::string msg;

public:
    NotEnoughRoom(uint32_t at, uint32_t requested_sz, uint32_t available_sz, const std::string& msg);
    NotEnoughRoom(uint32_t at, uint32_t requested_sz, uint32_t available_sz, const F& msg);

    const char* what() const noexcept override;
};

// The bytes do not conform to the declared/resolved type.
class DecodeError: public std::exception {
private:
    std::string msg;

public:
    explicit DecodeError(const std::string& msg);
    explicit DecodeError(const F& msg);

    // Decode failure at a known position of the input
    DecodeError(uint32_t at, const std::string& msg);
    DecodeError(uint32_t at, const F& msg);

    const char* what() const noexcept override;
};

// A value cannot be encoded with the given type (the value was not
// decoded from that type or it was built by hand incorrectly).
class EncodeError: public std::exception {
private:
    std::string msg;

public:
    explicit EncodeError(const std::string& msg);
    explicit EncodeError(const F& msg);

    const char* what() const noexcept override;
};
}  // namespace metaconf
