#pragma once

#include <stdexcept>
#include <string>

#include "metaconf/err/msg.h"

namespace metaconf {
// Raised by the assert_*() helpers; it fails the check that raised it.
class AssertionFailure: public std::exception {
private:
    std::string msg;

public:
    explicit AssertionFailure(const std::string& msg);
    explicit AssertionFailure(const F& msg);

    const char* what() const noexcept override;
};

// A state the harness should never reach (unknown enum value, schema used
// before being bound); unlike AssertionFailure it is not about the input.
class InternalError: public std::exception {
private:
    std::string msg;

public:
    explicit InternalError(const std::string& msg);
    explicit InternalError(const F& msg);

    const char* what() const noexcept override;
};
}  // namespace metaconf
