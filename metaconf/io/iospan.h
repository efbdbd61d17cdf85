#pragma once

#include <cstdint>
#include <span>

#include "metaconf/io/iobase.h"

namespace metaconf {
/*
 * Read bytes from a span of bytes. The span is not owned:
 * the caller must keep the underlying buffer alive while the
 * IOSpan is in use.
 * */
class IOSpan final: public IOBase {
private:
    const std::span<const uint8_t> dataspan;

public:
    explicit IOSpan(std::span<const uint8_t> dataspan);
    explicit IOSpan(const bytes_t& data);
    IOSpan(const uint8_t* data, uint32_t sz);

private:
    uint32_t rd_operation(char* data, const uint32_t data_sz) override final;
};
}  // namespace metaconf
