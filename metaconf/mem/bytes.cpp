#include "metaconf/mem/bytes.h"

#include <cctype>
#include <string>

#include "metaconf/err/exceptions.h"

namespace {
int hexval(char c) {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}
}  // namespace

namespace metaconf {
std::string to_hex(const bytes_t& bytes) {
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out += "0x";
    for (const auto b: bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }

    return out;
}

bytes_t from_hex(std::string_view hexstr) {
    while (not hexstr.empty() and std::isspace(static_cast<unsigned char>(hexstr[0]))) {
        hexstr.remove_prefix(1);
    }
    if (hexstr.size() >= 2 and hexstr[0] == '0' and (hexstr[1] == 'x' or hexstr[1] == 'X')) {
        hexstr.remove_prefix(2);
    }

    bytes_t out;
    out.reserve(hexstr.size() / 2);

    int hi = -1;
    for (size_t i = 0; i < hexstr.size(); ++i) {
        const char c = hexstr[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }

        const int v = hexval(c);
        if (v < 0) {
            throw DecodeError(F() << "Invalid hexadecimal character '" << c << "' at position " << i << ".");
        }

        if (hi < 0) {
            hi = v;
        } else {
            out.push_back(static_cast<uint8_t>((hi << 4) | v));
            hi = -1;
        }
    }

    if (hi >= 0) {
        throw DecodeError("Hexadecimal string has an odd count of digits.");
    }

    return out;
}
}  // namespace metaconf
