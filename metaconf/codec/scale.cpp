#include "metaconf/codec/scale.h"

#include <string>

#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf::scale {
uint8_t read_u8(IOBase& io) {
    const uint32_t at = io.tell_rd();
    try {
        return io.read_u8_from_le();
    } catch (const NotEnoughRoom& err) {
        throw DecodeError(at, F() << "Unexpected end of input. " << err.what());
    }
}

uint32_t read_u32(IOBase& io) {
    const uint32_t at = io.tell_rd();
    try {
        return io.read_u32_from_le();
    } catch (const NotEnoughRoom& err) {
        throw DecodeError(at, F() << "Unexpected end of input. " << err.what());
    }
}

bytes_t read_compact_magnitude(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint8_t first = read_u8(io);

    uint64_t num = 0;
    switch (first & 0x03) {
        case 0x00:
            num = first >> 2;
            break;
        case 0x01:
            num = (uint64_t(read_u8(io)) << 6) | (first >> 2);
            break;
        case 0x02: {
            num = first >> 2;
            for (int i = 0; i < 3; ++i) {
                num |= uint64_t(read_u8(io)) << (6 + 8 * i);
            }
            break;
        }
        case 0x03: {
            const uint32_t sz = (first >> 2) + 4;
            bytes_t magnitude;
            try {
                io.readall(magnitude, sz);
            } catch (const NotEnoughRoom& err) {
                throw DecodeError(at, F() << "Compact integer of " << sz << " bytes is truncated. " << err.what());
            }
            while (not magnitude.empty() and magnitude.back() == 0) {
                magnitude.pop_back();
            }
            return magnitude;
        }
    }

    bytes_t magnitude;
    while (num) {
        magnitude.push_back(uint8_t(num & 0xff));
        num >>= 8;
    }
    return magnitude;
}

uint64_t read_compact_u64(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const auto magnitude = read_compact_magnitude(io);
    if (magnitude.size() > 8) {
        throw DecodeError(at, F() << "Compact integer of " << magnitude.size() << " bytes does not fit in 64 bits.");
    }

    uint64_t num = 0;
    for (size_t i = 0; i < magnitude.size(); ++i) {
        num |= uint64_t(magnitude[i]) << (8 * i);
    }
    return num;
}

uint32_t read_compact_u32(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint64_t num = read_compact_u64(io);
    if (num > uint32_t(-1)) {
        throw DecodeError(at, F() << "Compact integer " << num << " does not fit in 32 bits.");
    }
    return uint32_t(num);
}

bool read_bool(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint8_t val = read_u8(io);
    if (val > 1) {
        throw DecodeError(at, F() << "Invalid boolean byte " << int(val) << ".");
    }
    return val == 1;
}

bytes_t read_bytes(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint32_t sz = read_compact_u32(io);

    bytes_t data;
    try {
        io.readall(data, sz);
    } catch (const NotEnoughRoom& err) {
        throw DecodeError(at, F() << "Byte string of length " << sz << " is truncated. " << err.what());
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "bytes at " << at << ": " << sz << " bytes" << TRACE_ENDL;
    return data;
}

std::string read_text(IOBase& io) {
    const auto data = read_bytes(io);
    return std::string(data.begin(), data.end());
}

std::vector<std::string> read_text_vec(IOBase& io) { return read_vec<std::string>(io, read_text); }

void write_text_vec(Writer& wr, const std::vector<std::string>& texts) {
    write_vec<std::string>(wr, texts, [](Writer& w, const std::string& text) { w.write_text(text); });
}

void throw_count_too_large(const IOBase& io, uint32_t cnt) {
    throw DecodeError(io.tell_rd(),
                      F() << "Sequence of " << cnt << " elements cannot fit in the remaining " << io.remain_rd()
                          << " bytes.");
}

void throw_bad_option_flag(uint32_t at, uint8_t flag) {
    throw DecodeError(at, F() << "Invalid option flag " << int(flag) << ", expected 0 or 1.");
}
}  // namespace metaconf::scale
