#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace metaconf {
typedef std::vector<uint8_t> bytes_t;

/*
 * Hexadecimal string form of the bytes, prefixed by "0x" and in lower case.
 * An empty buffer is "0x".
 * */
std::string to_hex(const bytes_t& bytes);

/*
 * Parse a hexadecimal string, with or without the "0x" prefix.
 * Whitespace (including new lines) between the digits is ignored so
 * blobs split in several lines can be parsed.
 *
 * Throw DecodeError if the string has an odd count of digits or
 * a non-hexadecimal character.
 * */
bytes_t from_hex(std::string_view hexstr);
}  // namespace metaconf
