#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "metaconf/mem/bytes.h"
#include "metaconf/mem/endianness.h"

namespace metaconf {
/*
 * Growable sink of bytes for the encoders.
 *
 * Unlike IOBase, the size of the output is not known beforehand so
 * the Writer appends to an internal buffer.
 * */
class Writer {
public:
    Writer() = default;

    void write_u8_to_le(uint8_t num) { buf.push_back(u8_to_le(num)); }

    void write_u16_to_le(uint16_t num) {
        num = u16_to_le(num);
        append(reinterpret_cast<const uint8_t*>(&num), sizeof(num));
    }

    void write_u32_to_le(uint32_t num) {
        num = u32_to_le(num);
        append(reinterpret_cast<const uint8_t*>(&num), sizeof(num));
    }

    void write_u64_to_le(uint64_t num) {
        num = u64_to_le(num);
        append(reinterpret_cast<const uint8_t*>(&num), sizeof(num));
    }

    void write_bool(bool val) { write_u8_to_le(val ? 1 : 0); }

    // Raw bytes, no length prefix
    void writeall(const bytes_t& data) { buf.insert(buf.end(), data.begin(), data.end()); }

    /*
     * Compact (variable length) encoding of an unsigned integer:
     * single byte, two and four bytes modes for values below 2^30
     * and the big-integer mode above.
     * */
    void write_compact(uint64_t num);

    /*
     * Compact encoding of an unsigned integer given by its little endian
     * magnitude (any count of bytes, trailing zeros are ignored).
     * */
    void write_compact(const bytes_t& le_magnitude);

    // Compact length prefix followed by the raw bytes
    void write_bytes(const bytes_t& data);

    // Compact length prefix followed by the UTF-8 bytes
    void write_text(const std::string& text);

    const bytes_t& data() const { return buf; }
    uint32_t size() const;

    bytes_t take() { return std::move(buf); }

private:
    void append(const uint8_t* data, size_t sz) { buf.insert(buf.end(), data, data + sz); }

    bytes_t buf;
};
}  // namespace metaconf
