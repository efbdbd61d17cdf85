#pragma once

#include <iomanip>
#include <iostream>

#define METACONF_TRACE_CODEC 0x01
#define METACONF_TRACE_FIXTURE 0x02
#define METACONF_TRACE_CONVERT 0x04
#define METACONF_TRACE_DEFAULTS 0x08

namespace metaconf::log {
extern int __METACONF_TRACE_MASK;

#define TRACE_ON(mask)                                                           \
    do {                                                                         \
        if ((mask)&metaconf::log::__METACONF_TRACE_MASK) {                       \
            std::ios_base::fmtflags _io_metaconf_flags = std::cerr.flags();      \
        std::cerr
#define TRACE_FLUSH                      \
    std::flush;                          \
    std::cerr.flags(_io_metaconf_flags); \
    }                                    \
    }                                    \
    while (0)
#define TRACE_ENDL                       \
    std::endl;                           \
    std::cerr.flags(_io_metaconf_flags); \
    }                                    \
    }                                    \
    while (0)

/*
 * Mask from a number ("12", "0x0c") or from a comma separated list
 * of names: codec, fixture, convert, defaults or all. Unknown names
 * are ignored.
 * */
int parse_trace_mask(const char* valstr);

void set_trace_mask_from_env();
}  // namespace metaconf::log
