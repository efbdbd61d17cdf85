#include "metaconf/meta/metadata.h"

#include <string>
#include <utility>

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/io/iospan.h"
#include "metaconf/log/format_string.h"
#include "metaconf/log/trace.h"
#include "metaconf/meta/convert.h"

namespace metaconf {
Metadata Metadata::decode(const bytes_t& data) {
    IOSpan io(data);

    const uint32_t magic = scale::read_u32(io);
    if (magic != MAGIC_NUMBER) {
        throw DecodeError(0, F() << "Bad magic number " << log::hex(magic) << ", expected "
                                 << log::hex(MAGIC_NUMBER) << ".");
    }

    const uint8_t version = scale::read_u8(io);
    if (version < MIN_VERSION or version > LATEST_VERSION) {
        throw DecodeError(4, F() << "Unsupported metadata version " << int(version) << ", expected v"
                                 << int(MIN_VERSION) << " to v" << int(LATEST_VERSION) << ".");
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "metadata v" << int(version) << ": " << data.size() << " bytes"
                                   << TRACE_ENDL;

    auto make = [&]() {
        if (version < 14) {
            return Metadata(legacy::read_body(io, version));
        }
        return Metadata(portable::read_body(io, version));
    };

    Metadata metadata = make();
    if (io.remain_rd() != 0) {
        throw DecodeError(io.tell_rd(), F() << "Unexpected " << io.remain_rd()
                                            << " trailing bytes after the metadata body.");
    }
    return metadata;
}

Metadata Metadata::from_hex(std::string_view hexstr) { return decode(metaconf::from_hex(hexstr)); }

Metadata::Metadata(legacy::MetadataBody body): magic(MAGIC_NUMBER), body(std::move(body)) {}

Metadata::Metadata(portable::MetadataBody body): magic(MAGIC_NUMBER), body(std::move(body)) {}

uint8_t Metadata::version() const {
    if (is_legacy()) {
        return std::get<legacy::MetadataBody>(body).version;
    }
    return std::get<portable::MetadataBody>(body).version;
}

const legacy::MetadataBody& Metadata::legacy_body() const {
    if (not is_legacy()) {
        throw InternalError(F() << "Metadata v" << int(version()) << " has no legacy body.");
    }
    return std::get<legacy::MetadataBody>(body);
}

const portable::MetadataBody& Metadata::portable_body() const {
    if (is_legacy()) {
        throw InternalError(F() << "Metadata v" << int(version()) << " has no portable body.");
    }
    return std::get<portable::MetadataBody>(body);
}

const portable::MetadataBody& Metadata::as_latest() const {
    if (latest) {
        return *latest;
    }

    if (is_legacy()) {
        latest = std::make_shared<const portable::MetadataBody>(convert_to_latest(legacy_body()));
    } else if (version() == LATEST_VERSION) {
        latest = std::make_shared<const portable::MetadataBody>(portable_body());
    } else {
        latest = std::make_shared<const portable::MetadataBody>(convert_to_latest(portable_body()));
    }
    return *latest;
}

Metadata Metadata::as_calls_only() const { return Metadata(to_calls_only(as_latest())); }

bytes_t Metadata::to_bytes() const {
    Writer wr;
    wr.write_u32_to_le(magic);
    wr.write_u8_to_le(version());
    if (is_legacy()) {
        legacy::write_body(wr, legacy_body());
    } else {
        portable::write_body(wr, portable_body());
    }
    return wr.take();
}

std::string Metadata::to_hex() const { return metaconf::to_hex(to_bytes()); }

nlohmann::json Metadata::to_json() const {
    const std::string key = "v" + std::to_string(version());
    const nlohmann::json body_json =
            is_legacy() ? legacy::to_json(legacy_body()) : portable::to_json(portable_body());
    return {{"magicNumber", magic}, {"metadata", {{key, body_json}}}};
}
}  // namespace metaconf
