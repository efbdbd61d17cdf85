#include "metaconf/io/iobase.h"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "metaconf/err/exceptions.h"

namespace metaconf {
IOBase::IOBase(const uint32_t src_sz): src_sz(src_sz), rd(0) {}

void IOBase::rd_operation_exact_sz(char* data, const uint32_t exact_sz) {
    const uint32_t at = rd;
    const uint32_t remain_sz = remain_rd();
    if (remain_sz < exact_sz) {
        throw NotEnoughRoom(at, exact_sz, remain_sz, "Detected before the read.");
    }

    const uint32_t rd_total_sz = rd_operation(data, exact_sz);
    if (rd_total_sz != exact_sz) {
        throw NotEnoughRoom(at, exact_sz, rd_total_sz,
                            F() << "The source returned a short read (pointer left at position " << rd << ").");
    }
}

uint32_t IOBase::calc_seek(uint32_t pos, uint32_t cur, IOBase::Seekdir way) const {
    switch (way) {
        case Seekdir::beg:
            return std::min(pos, src_sz);
        case Seekdir::end:
            if (src_sz < pos) {
                return 0;
            }
            return src_sz - pos;
        case Seekdir::fwd:
            cur = cur + pos;
            if (cur < pos or cur > src_sz) {
                return src_sz;  // overflow
            }
            return cur;
        case Seekdir::bwd:
            if (cur < pos) {
                return 0;  // underflow
            }
            return cur - pos;
    }
    throw InternalError(F() << "Unexpected seek direction " << int(way) << ".");
}

bytes_t IOBase::dump(uint32_t at, uint32_t len) {
    auto guard = auto_rewind();

    seek_rd(at);
    const uint32_t sz = std::min(len, remain_rd());

    bytes_t buf;
    readall(buf, sz);
    return buf;
}

std::string IOBase::hexdump(uint32_t at, uint32_t len) {
    const auto buf = dump(at, len);

    std::ostringstream out;
    for (size_t i = 0; i < buf.size(); ++i) {
        out << std::setfill('0') << std::setw(2) << std::hex << int(buf[i]);
        if (i % 2 == 1 and i + 1 < buf.size()) {
            out << " ";
        }
    }

    return out.str();
}
}  // namespace metaconf
