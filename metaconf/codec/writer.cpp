#include "metaconf/codec/writer.h"

#include <string>

#include "metaconf/err/exceptions.h"
#include "metaconf/mem/casts.h"

namespace metaconf {
void Writer::write_compact(uint64_t num) {
    if (num < (uint64_t(1) << 6)) {
        write_u8_to_le(uint8_t(num << 2));
    } else if (num < (uint64_t(1) << 14)) {
        write_u16_to_le(uint16_t((num << 2) | 0x01));
    } else if (num < (uint64_t(1) << 30)) {
        write_u32_to_le(uint32_t((num << 2) | 0x02));
    } else {
        bytes_t le_magnitude;
        while (num) {
            le_magnitude.push_back(uint8_t(num & 0xff));
            num >>= 8;
        }
        write_compact(le_magnitude);
    }
}

void Writer::write_compact(const bytes_t& le_magnitude) {
    size_t sz = le_magnitude.size();
    while (sz > 0 and le_magnitude[sz - 1] == 0) {
        --sz;
    }

    if (sz <= 4) {
        uint32_t num = 0;
        for (size_t i = 0; i < sz; ++i) {
            num |= uint32_t(le_magnitude[i]) << (8 * i);
        }

        if (num < (uint32_t(1) << 30)) {
            write_compact(uint64_t(num));
            return;
        }

        // Values in [2^30, 2^32) need the big-integer mode with 4 bytes
        sz = 4;
    }

    if (sz > 67) {
        throw EncodeError(F() << "Integer of " << sz << " bytes is too large for the compact encoding.");
    }

    write_u8_to_le(uint8_t(((sz - 4) << 2) | 0x03));
    for (size_t i = 0; i < sz; ++i) {
        write_u8_to_le(i < le_magnitude.size() ? le_magnitude[i] : 0);
    }
}

void Writer::write_bytes(const bytes_t& data) {
    write_compact(uint64_t(data.size()));
    writeall(data);
}

void Writer::write_text(const std::string& text) {
    write_compact(uint64_t(text.size()));
    append(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

uint32_t Writer::size() const { return assert_u32(buf.size()); }
}  // namespace metaconf
