#include "metaconf/log/trace.h"

#include <cstdlib>
#include <sstream>
#include <string>

namespace metaconf::log {
// Do not modify this unless via calling set_trace_mask_from_env()
int __METACONF_TRACE_MASK = 0;

namespace {
int mask_of_name(const std::string& name) {
    if (name == "codec") {
        return METACONF_TRACE_CODEC;
    } else if (name == "fixture") {
        return METACONF_TRACE_FIXTURE;
    } else if (name == "convert") {
        return METACONF_TRACE_CONVERT;
    } else if (name == "defaults") {
        return METACONF_TRACE_DEFAULTS;
    } else if (name == "all") {
        return METACONF_TRACE_CODEC | METACONF_TRACE_FIXTURE | METACONF_TRACE_CONVERT | METACONF_TRACE_DEFAULTS;
    }
    return 0;
}
}  // namespace

int parse_trace_mask(const char* valstr) {
    if (not valstr or valstr[0] == '\0') {
        return 0;
    }

    // numeric masks: "12", "0x0c"
    char* end = nullptr;
    const long num = std::strtol(valstr, &end, 0);
    if (end != valstr and *end == '\0') {
        return int(num);
    }

    int mask = 0;
    std::stringstream ss(valstr);
    std::string name;
    while (std::getline(ss, name, ',')) {
        mask |= mask_of_name(name);
    }
    return mask;
}

// You must call this as soon as main() starts and call it
// only once
void set_trace_mask_from_env() { __METACONF_TRACE_MASK = parse_trace_mask(std::getenv("METACONF_TRACE")); }
}  // namespace metaconf::log
