#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "metaconf/err/msg.h"

namespace metaconf {
// Decoded-then-reencoded bytes differ from the source bytes.
class FidelityError: public std::exception {
private:
    std::string msg;
    int64_t missing;

public:
    FidelityError(uint64_t expected_sz, uint64_t actual_sz, const std::string& msg);
    FidelityError(uint64_t expected_sz, uint64_t actual_sz, const F& msg);

    /*
     * How many bytes the re-encoded form has less than the source.
     * Negative if the re-encoded form is longer.
     * */
    int64_t bytes_missing() const noexcept { return missing; }

    const char* what() const noexcept override;
};
}  // namespace metaconf
