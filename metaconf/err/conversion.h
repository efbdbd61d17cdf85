#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "metaconf/err/msg.h"

namespace metaconf {
// The latest-version projection cannot be built.
class ConversionError: public std::exception {
private:
    std::string msg;

public:
    ConversionError(unsigned version, const std::string& msg);
    ConversionError(unsigned version, const F& msg);

    const char* what() const noexcept override;
};

// Two distinct type definitions share the same deduplication identity.
class TypeCollision: public std::exception {
private:
    std::string msg;

public:
    TypeCollision(const std::string& name, uint32_t first_id, uint32_t second_id, const std::string& msg);
    TypeCollision(const std::string& name, uint32_t first_id, uint32_t second_id, const F& msg);

    const char* what() const noexcept override;
};
}  // namespace metaconf
