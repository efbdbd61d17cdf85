#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metaconf/codec/writer.h"
#include "metaconf/io/iobase.h"
#include "metaconf/meta/common.h"
#include "metaconf/meta/si.h"

#include <nlohmann/json.hpp>

/*
 * Bodies of the metadata versions 14 and 15: every type is a reference
 * to the portable registry (lookup) carried by the body itself.
 *
 * v15 is the latest version and the target of all the conversions.
 * */
namespace metaconf::portable {
struct StorageEntry {
    enum class Kind : uint8_t {
        Plain = 0,
        Map = 1,
    };

    std::string name;
    StorageModifier modifier = StorageModifier::Optional;

    Kind kind = Kind::Plain;

    // Map only
    std::vector<StorageHasher> hashers;
    LookupId key = 0;

    LookupId value = 0;

    bytes_t fallback;
    std::vector<std::string> docs;
};

struct PalletStorage {
    std::string prefix;
    std::vector<StorageEntry> items;
};

struct PalletConstant {
    std::string name;
    LookupId type = 0;
    bytes_t value;
    std::vector<std::string> docs;
};

struct Pallet {
    std::string name;
    std::optional<PalletStorage> storage;
    std::optional<LookupId> calls;
    std::optional<LookupId> event;
    std::vector<PalletConstant> constants;
    std::optional<LookupId> error;
    uint8_t index = 0;

    // v15+
    std::vector<std::string> docs;
};

struct SignedExtension {
    std::string identifier;
    LookupId type = 0;
    LookupId additional_signed = 0;
};

struct Extrinsic {
    LookupId type = 0;
    uint8_t version = 0;
    std::vector<SignedExtension> signed_extensions;
};

struct RuntimeApiParam {
    std::string name;
    LookupId type = 0;
};

struct RuntimeApiMethod {
    std::string name;
    std::vector<RuntimeApiParam> inputs;
    LookupId output = 0;
    std::vector<std::string> docs;
};

struct RuntimeApi {
    std::string name;
    std::vector<RuntimeApiMethod> methods;
    std::vector<std::string> docs;
};

struct OuterEnums {
    LookupId call_type = 0;
    LookupId event_type = 0;
    LookupId error_type = 0;
};

struct MetadataBody {
    uint8_t version = 15;
    PortableRegistry lookup;
    std::vector<Pallet> pallets;
    Extrinsic extrinsic;
    LookupId type = 0;

    // v15+
    std::vector<RuntimeApi> apis;
    OuterEnums outer_enums;
};

MetadataBody read_body(IOBase& io, uint8_t version);
void write_body(Writer& wr, const MetadataBody& body);

nlohmann::json to_json(const MetadataBody& body);
}  // namespace metaconf::portable
