#include "metaconf/err/fidelity.h"

#include <string>

namespace metaconf {
FidelityError::FidelityError(uint64_t expected_sz, uint64_t actual_sz, const std::string& msg):
        msg(msg), missing(static_cast<int64_t>(expected_sz) - static_cast<int64_t>(actual_sz)) {}

FidelityError::FidelityError(uint64_t expected_sz, uint64_t actual_sz, const F& msg):
        FidelityError(expected_sz, actual_sz, msg.ss.str()) {}

const char* FidelityError::what() const noexcept { return msg.data(); }
}  // namespace metaconf
