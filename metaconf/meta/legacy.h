#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metaconf/codec/writer.h"
#include "metaconf/io/iobase.h"
#include "metaconf/meta/common.h"

#include <nlohmann/json.hpp>

/*
 * Bodies of the metadata versions 9 to 13. Types are referenced by
 * their legacy type expression (text) and resolved by name by the
 * TypeRegistry.
 *
 * A single set of structures covers the five versions; the fields
 * that exist only in some versions are noted.
 * */
namespace metaconf::legacy {
struct StorageEntryType {
    enum class Kind : uint8_t {
        Plain = 0,
        Map = 1,
        DoubleMap = 2,
        NMap = 3,  // v13+
    };

    Kind kind = Kind::Plain;

    // Map and DoubleMap (first key)
    StorageHasher hasher = StorageHasher::Blake2_128;
    std::string key;

    // Plain, Map, DoubleMap and NMap
    std::string value;

    // Map, v9 to v12
    bool linked = false;

    // DoubleMap
    std::string key2;
    StorageHasher key2_hasher = StorageHasher::Blake2_128;

    // NMap
    std::vector<std::string> keys;
    std::vector<StorageHasher> hashers;
};

struct StorageEntry {
    std::string name;
    StorageModifier modifier = StorageModifier::Optional;
    StorageEntryType type;
    bytes_t fallback;
    std::vector<std::string> docs;
};

struct Storage {
    std::string prefix;
    std::vector<StorageEntry> items;
};

struct Argument {
    std::string name;
    std::string type;
};

struct Call {
    std::string name;
    std::vector<Argument> args;
    std::vector<std::string> docs;
};

struct Event {
    std::string name;
    std::vector<std::string> args;
    std::vector<std::string> docs;
};

struct Constant {
    std::string name;
    std::string type;
    bytes_t value;
    std::vector<std::string> docs;
};

struct Error {
    std::string name;
    std::vector<std::string> docs;
};

struct Module {
    std::string name;
    std::optional<Storage> storage;
    std::optional<std::vector<Call>> calls;
    std::optional<std::vector<Event>> events;
    std::vector<Constant> constants;
    std::vector<Error> errors;

    // v12+
    uint8_t index = 0;
};

// v11+
struct Extrinsic {
    uint8_t version = 0;
    std::vector<std::string> signed_extensions;
};

struct MetadataBody {
    uint8_t version = 9;
    std::vector<Module> modules;
    Extrinsic extrinsic;
};

MetadataBody read_body(IOBase& io, uint8_t version);
void write_body(Writer& wr, const MetadataBody& body);

nlohmann::json to_json(const MetadataBody& body);
}  // namespace metaconf::legacy
