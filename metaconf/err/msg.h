#pragma once

#include <sstream>
#include <string>

namespace metaconf {
struct F {
    std::stringstream ss;

    template <typename T>
    F& operator<<(const T& val) {
        ss << val;
        return *this;
    }

    std::string str() const { return ss.str(); }
};
}  // namespace metaconf
