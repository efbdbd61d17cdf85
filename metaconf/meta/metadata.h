#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "metaconf/mem/bytes.h"
#include "metaconf/meta/legacy.h"
#include "metaconf/meta/portable.h"

#include <nlohmann/json.hpp>

namespace metaconf {
/*
 * Decoded metadata of one schema version.
 *
 * The encoded form is the magic number "meta" (u32, little endian),
 * the version (u8) and the version-specific body.
 *
 * Once constructed, the metadata is not modified: the projections
 * as_latest() and as_calls_only() build new objects (as_latest() is
 * computed once and cached).
 * */
class Metadata {
public:
    constexpr static uint32_t MAGIC_NUMBER = 0x6174656d;
    constexpr static uint8_t MIN_VERSION = 9;
    constexpr static uint8_t LATEST_VERSION = 15;

    /*
     * Decode the metadata from its encoded form. The whole input must be
     * consumed.
     *
     * Throw DecodeError if the input is malformed, truncated, has
     * a wrong magic number or an unsupported version.
     * */
    static Metadata decode(const bytes_t& data);
    static Metadata from_hex(std::string_view hexstr);

    explicit Metadata(legacy::MetadataBody body);
    explicit Metadata(portable::MetadataBody body);

    uint8_t version() const;

    // Versions 9 to 13 have a legacy body; 14 and 15 a portable one
    bool is_legacy() const { return std::holds_alternative<legacy::MetadataBody>(body); }

    // Throw InternalError if the body is not of the requested kind
    const legacy::MetadataBody& legacy_body() const;
    const portable::MetadataBody& portable_body() const;

    /*
     * The metadata converted to the latest version (v15). For v15
     * metadata this is the body itself.
     *
     * Throw ConversionError if the conversion is not possible.
     * */
    const portable::MetadataBody& as_latest() const;

    /*
     * Reduced latest-version metadata keeping only what is needed to
     * construct and decode calls: the lookup, the extrinsic, the runtime
     * type, the outer enums and for each pallet its name, index and calls.
     * */
    Metadata as_calls_only() const;

    bytes_t to_bytes() const;
    std::string to_hex() const;

    /*
     * Canonical structural tree:
     *
     *   {"magicNumber": 1635018093, "metadata": {"v<version>": {...}}}
     *
     * Keys are in camelCase, byte strings are in hexadecimal ("0x...").
     * */
    nlohmann::json to_json() const;

private:
    uint32_t magic;
    std::variant<legacy::MetadataBody, portable::MetadataBody> body;

    mutable std::shared_ptr<const portable::MetadataBody> latest;
};
}  // namespace metaconf
