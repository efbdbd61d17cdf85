#include "metaconf/io/iospan.h"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "metaconf/err/exceptions.h"

namespace {
uint32_t chk_span_size(size_t sz) {
    if (sz > uint32_t(-1)) {
        throw std::overflow_error(
                (metaconf::F() << "Span of " << sz << " bytes is too large to be read by an IOSpan.").str());
    }
    return static_cast<uint32_t>(sz);
}
}  // namespace

namespace metaconf {
IOSpan::IOSpan(std::span<const uint8_t> dataspan): IOBase(chk_span_size(dataspan.size())), dataspan(dataspan) {}

IOSpan::IOSpan(const bytes_t& data): IOSpan(std::span<const uint8_t>(data.data(), data.size())) {}

IOSpan::IOSpan(const uint8_t* data, uint32_t sz): IOSpan(std::span<const uint8_t>(data, sz)) {}

uint32_t IOSpan::rd_operation(char* data, const uint32_t data_sz) {
    uint32_t rd_total_sz = std::min(data_sz, remain_rd());

    if (rd_total_sz > 0) {
        memcpy(data, dataspan.data() + rd, rd_total_sz);
    }
    rd += rd_total_sz;

    return rd_total_sz;
}
}  // namespace metaconf
