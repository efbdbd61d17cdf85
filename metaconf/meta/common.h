#pragma once

#include <cstdint>
#include <string>

#include "metaconf/codec/writer.h"
#include "metaconf/io/iobase.h"

#include <nlohmann/json.hpp>

namespace metaconf {
/*
 * Hashers of the storage keys. The same set (and wire indexes)
 * is used by the legacy and the portable bodies.
 * */
enum class StorageHasher : uint8_t {
    Blake2_128 = 0,
    Blake2_256 = 1,
    Blake2_128Concat = 2,
    Twox128 = 3,
    Twox256 = 4,
    Twox64Concat = 5,
    Identity = 6,
};

enum class StorageModifier : uint8_t {
    Optional = 0,
    Default = 1,
};

StorageHasher read_storage_hasher(IOBase& io);
StorageModifier read_storage_modifier(IOBase& io);

void write_storage_hasher(Writer& wr, StorageHasher hasher);
void write_storage_modifier(Writer& wr, StorageModifier modifier);

const char* storage_hasher_name(StorageHasher hasher);
const char* storage_modifier_name(StorageModifier modifier);

nlohmann::json storage_hasher_to_json(StorageHasher hasher);
nlohmann::json storage_modifier_to_json(StorageModifier modifier);
}  // namespace metaconf
