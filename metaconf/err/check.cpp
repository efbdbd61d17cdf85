#include "metaconf/err/check.h"

#include <sstream>
#include <string>

namespace metaconf {
AssertionFailure::AssertionFailure(const std::string& msg) { this->msg = msg; }

AssertionFailure::AssertionFailure(const F& msg): AssertionFailure(msg.ss.str()) {}

const char* AssertionFailure::what() const noexcept { return msg.data(); }

InternalError::InternalError(const std::string& msg) {
    std::stringstream ss;
    ss << "[Possible bug detected] " << msg;

    this->msg = ss.str();
}

InternalError::InternalError(const F& msg): InternalError(msg.ss.str()) {}

const char* InternalError::what() const noexcept { return msg.data(); }
}  // namespace metaconf
