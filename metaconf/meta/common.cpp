#include "metaconf/meta/common.h"

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"

namespace metaconf {
StorageHasher read_storage_hasher(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint8_t val = scale::read_u8(io);
    if (val > uint8_t(StorageHasher::Identity)) {
        throw DecodeError(at, F() << "Unknown storage hasher " << int(val) << ".");
    }
    return StorageHasher(val);
}

StorageModifier read_storage_modifier(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint8_t val = scale::read_u8(io);
    if (val > uint8_t(StorageModifier::Default)) {
        throw DecodeError(at, F() << "Unknown storage modifier " << int(val) << ".");
    }
    return StorageModifier(val);
}

void write_storage_hasher(Writer& wr, StorageHasher hasher) { wr.write_u8_to_le(uint8_t(hasher)); }

void write_storage_modifier(Writer& wr, StorageModifier modifier) { wr.write_u8_to_le(uint8_t(modifier)); }

const char* storage_hasher_name(StorageHasher hasher) {
    switch (hasher) {
        case StorageHasher::Blake2_128:
            return "Blake2_128";
        case StorageHasher::Blake2_256:
            return "Blake2_256";
        case StorageHasher::Blake2_128Concat:
            return "Blake2_128Concat";
        case StorageHasher::Twox128:
            return "Twox128";
        case StorageHasher::Twox256:
            return "Twox256";
        case StorageHasher::Twox64Concat:
            return "Twox64Concat";
        case StorageHasher::Identity:
            return "Identity";
    }
    throw InternalError(F() << "Unknown storage hasher " << int(hasher) << ".");
}

const char* storage_modifier_name(StorageModifier modifier) {
    switch (modifier) {
        case StorageModifier::Optional:
            return "Optional";
        case StorageModifier::Default:
            return "Default";
    }
    throw InternalError(F() << "Unknown storage modifier " << int(modifier) << ".");
}

nlohmann::json storage_hasher_to_json(StorageHasher hasher) { return storage_hasher_name(hasher); }

nlohmann::json storage_modifier_to_json(StorageModifier modifier) { return storage_modifier_name(modifier); }
}  // namespace metaconf
