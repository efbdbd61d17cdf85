#include "metaconf/meta/legacy.h"

#include <string>
#include <utility>

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf::legacy {
namespace {
bool has_linked_maps(uint8_t version) { return version <= 12; }
bool has_nmaps(uint8_t version) { return version >= 13; }
bool has_module_index(uint8_t version) { return version >= 12; }
bool has_extrinsic(uint8_t version) { return version >= 11; }

StorageEntryType read_entry_type(IOBase& io, uint8_t version) {
    const uint32_t at = io.tell_rd();
    const uint8_t kind = scale::read_u8(io);

    StorageEntryType type;
    type.kind = StorageEntryType::Kind(kind);
    switch (type.kind) {
        case StorageEntryType::Kind::Plain:
            type.value = scale::read_text(io);
            break;
        case StorageEntryType::Kind::Map:
            type.hasher = read_storage_hasher(io);
            type.key = scale::read_text(io);
            type.value = scale::read_text(io);
            if (has_linked_maps(version)) {
                type.linked = scale::read_bool(io);
            }
            break;
        case StorageEntryType::Kind::DoubleMap:
            type.hasher = read_storage_hasher(io);
            type.key = scale::read_text(io);
            type.key2 = scale::read_text(io);
            type.value = scale::read_text(io);
            type.key2_hasher = read_storage_hasher(io);
            break;
        case StorageEntryType::Kind::NMap:
            if (not has_nmaps(version)) {
                throw DecodeError(at, F() << "NMap storage entries are not supported in v" << int(version) << ".");
            }
            type.keys = scale::read_text_vec(io);
            type.hashers = scale::read_vec<StorageHasher>(io, read_storage_hasher);
            type.value = scale::read_text(io);
            break;
        default:
            throw DecodeError(at, F() << "Unknown storage entry type " << int(kind) << ".");
    }
    return type;
}

void write_entry_type(Writer& wr, const StorageEntryType& type, uint8_t version) {
    wr.write_u8_to_le(uint8_t(type.kind));
    switch (type.kind) {
        case StorageEntryType::Kind::Plain:
            wr.write_text(type.value);
            break;
        case StorageEntryType::Kind::Map:
            write_storage_hasher(wr, type.hasher);
            wr.write_text(type.key);
            wr.write_text(type.value);
            if (has_linked_maps(version)) {
                wr.write_bool(type.linked);
            }
            break;
        case StorageEntryType::Kind::DoubleMap:
            write_storage_hasher(wr, type.hasher);
            wr.write_text(type.key);
            wr.write_text(type.key2);
            wr.write_text(type.value);
            write_storage_hasher(wr, type.key2_hasher);
            break;
        case StorageEntryType::Kind::NMap:
            scale::write_text_vec(wr, type.keys);
            scale::write_vec<StorageHasher>(wr, type.hashers, write_storage_hasher);
            wr.write_text(type.value);
            break;
        default:
            throw InternalError(F() << "Unknown storage entry type " << int(type.kind) << ".");
    }
}

StorageEntry read_entry(IOBase& io, uint8_t version) {
    StorageEntry entry;
    entry.name = scale::read_text(io);
    entry.modifier = read_storage_modifier(io);
    entry.type = read_entry_type(io, version);
    entry.fallback = scale::read_bytes(io);
    entry.docs = scale::read_text_vec(io);
    return entry;
}

Storage read_storage(IOBase& io, uint8_t version) {
    Storage storage;
    storage.prefix = scale::read_text(io);
    storage.items = scale::read_vec<StorageEntry>(io, [version](IOBase& io) { return read_entry(io, version); });
    return storage;
}

Argument read_argument(IOBase& io) {
    Argument arg;
    arg.name = scale::read_text(io);
    arg.type = scale::read_text(io);
    return arg;
}

Call read_call(IOBase& io) {
    Call call;
    call.name = scale::read_text(io);
    call.args = scale::read_vec<Argument>(io, read_argument);
    call.docs = scale::read_text_vec(io);
    return call;
}

Event read_event(IOBase& io) {
    Event event;
    event.name = scale::read_text(io);
    event.args = scale::read_text_vec(io);
    event.docs = scale::read_text_vec(io);
    return event;
}

Constant read_constant(IOBase& io) {
    Constant constant;
    constant.name = scale::read_text(io);
    constant.type = scale::read_text(io);
    constant.value = scale::read_bytes(io);
    constant.docs = scale::read_text_vec(io);
    return constant;
}

Error read_error(IOBase& io) {
    Error error;
    error.name = scale::read_text(io);
    error.docs = scale::read_text_vec(io);
    return error;
}

Module read_module(IOBase& io, uint8_t version) {
    Module mod;
    mod.name = scale::read_text(io);
    mod.storage = scale::read_option<Storage>(io, [version](IOBase& io) { return read_storage(io, version); });
    mod.calls = scale::read_option<std::vector<Call>>(
            io, [](IOBase& io) { return scale::read_vec<Call>(io, read_call); });
    mod.events = scale::read_option<std::vector<Event>>(
            io, [](IOBase& io) { return scale::read_vec<Event>(io, read_event); });
    mod.constants = scale::read_vec<Constant>(io, read_constant);
    mod.errors = scale::read_vec<Error>(io, read_error);
    if (has_module_index(version)) {
        mod.index = scale::read_u8(io);
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "module " << mod.name << " ("
                                   << (mod.storage ? mod.storage->items.size() : 0) << " storage items)"
                                   << TRACE_ENDL;
    return mod;
}

void write_module(Writer& wr, const Module& mod, uint8_t version) {
    wr.write_text(mod.name);

    scale::write_option<Storage>(wr, mod.storage, [version](Writer& w, const Storage& storage) {
        w.write_text(storage.prefix);
        scale::write_vec<StorageEntry>(w, storage.items, [version](Writer& w, const StorageEntry& entry) {
            w.write_text(entry.name);
            write_storage_modifier(w, entry.modifier);
            write_entry_type(w, entry.type, version);
            w.write_bytes(entry.fallback);
            scale::write_text_vec(w, entry.docs);
        });
    });

    scale::write_option<std::vector<Call>>(wr, mod.calls, [](Writer& w, const std::vector<Call>& calls) {
        scale::write_vec<Call>(w, calls, [](Writer& w, const Call& call) {
            w.write_text(call.name);
            scale::write_vec<Argument>(w, call.args, [](Writer& w, const Argument& arg) {
                w.write_text(arg.name);
                w.write_text(arg.type);
            });
            scale::write_text_vec(w, call.docs);
        });
    });

    scale::write_option<std::vector<Event>>(wr, mod.events, [](Writer& w, const std::vector<Event>& events) {
        scale::write_vec<Event>(w, events, [](Writer& w, const Event& event) {
            w.write_text(event.name);
            scale::write_text_vec(w, event.args);
            scale::write_text_vec(w, event.docs);
        });
    });

    scale::write_vec<Constant>(wr, mod.constants, [](Writer& w, const Constant& constant) {
        w.write_text(constant.name);
        w.write_text(constant.type);
        w.write_bytes(constant.value);
        scale::write_text_vec(w, constant.docs);
    });

    scale::write_vec<Error>(wr, mod.errors, [](Writer& w, const Error& error) {
        w.write_text(error.name);
        scale::write_text_vec(w, error.docs);
    });

    if (has_module_index(version)) {
        wr.write_u8_to_le(mod.index);
    }
}

nlohmann::json entry_type_to_json(const StorageEntryType& type, uint8_t version) {
    switch (type.kind) {
        case StorageEntryType::Kind::Plain:
            return {{"plain", type.value}};
        case StorageEntryType::Kind::Map: {
            nlohmann::json map = {{"hasher", storage_hasher_to_json(type.hasher)},
                                  {"key", type.key},
                                  {"value", type.value}};
            if (has_linked_maps(version)) {
                map["linked"] = type.linked;
            }
            return {{"map", map}};
        }
        case StorageEntryType::Kind::DoubleMap:
            return {{"doubleMap",
                     {{"hasher", storage_hasher_to_json(type.hasher)},
                      {"key1", type.key},
                      {"key2", type.key2},
                      {"value", type.value},
                      {"key2Hasher", storage_hasher_to_json(type.key2_hasher)}}}};
        case StorageEntryType::Kind::NMap: {
            auto hashers = nlohmann::json::array();
            for (auto hasher: type.hashers) {
                hashers.push_back(storage_hasher_to_json(hasher));
            }
            return {{"nMap", {{"keys", type.keys}, {"hashers", hashers}, {"value", type.value}}}};
        }
    }
    throw InternalError(F() << "Unknown storage entry type " << int(type.kind) << ".");
}

nlohmann::json module_to_json(const Module& mod, uint8_t version) {
    nlohmann::json storage = nullptr;
    if (mod.storage) {
        auto items = nlohmann::json::array();
        for (const auto& entry: mod.storage->items) {
            items.push_back({{"name", entry.name},
                             {"modifier", storage_modifier_to_json(entry.modifier)},
                             {"type", entry_type_to_json(entry.type, version)},
                             {"fallback", to_hex(entry.fallback)},
                             {"docs", entry.docs}});
        }
        storage = {{"prefix", mod.storage->prefix}, {"items", items}};
    }

    nlohmann::json calls = nullptr;
    if (mod.calls) {
        calls = nlohmann::json::array();
        for (const auto& call: *mod.calls) {
            auto args = nlohmann::json::array();
            for (const auto& arg: call.args) {
                args.push_back({{"name", arg.name}, {"type", arg.type}});
            }
            calls.push_back({{"name", call.name}, {"args", args}, {"docs", call.docs}});
        }
    }

    nlohmann::json events = nullptr;
    if (mod.events) {
        events = nlohmann::json::array();
        for (const auto& event: *mod.events) {
            events.push_back({{"name", event.name}, {"args", event.args}, {"docs", event.docs}});
        }
    }

    auto constants = nlohmann::json::array();
    for (const auto& constant: mod.constants) {
        constants.push_back({{"name", constant.name},
                             {"type", constant.type},
                             {"value", to_hex(constant.value)},
                             {"docs", constant.docs}});
    }

    auto errors = nlohmann::json::array();
    for (const auto& error: mod.errors) {
        errors.push_back({{"name", error.name}, {"docs", error.docs}});
    }

    nlohmann::json json = {{"name", mod.name},   {"storage", storage},     {"calls", calls},
                           {"events", events},   {"constants", constants}, {"errors", errors}};
    if (has_module_index(version)) {
        json["index"] = mod.index;
    }
    return json;
}
}  // namespace

MetadataBody read_body(IOBase& io, uint8_t version) {
    if (version < 9 or version > 13) {
        throw InternalError(F() << "Legacy metadata body of unsupported version " << int(version) << ".");
    }

    MetadataBody body;
    body.version = version;
    body.modules = scale::read_vec<Module>(io, [version](IOBase& io) { return read_module(io, version); });
    if (has_extrinsic(version)) {
        body.extrinsic.version = scale::read_u8(io);
        body.extrinsic.signed_extensions = scale::read_text_vec(io);
    }
    return body;
}

void write_body(Writer& wr, const MetadataBody& body) {
    scale::write_vec<Module>(wr, body.modules,
                             [&body](Writer& w, const Module& mod) { write_module(w, mod, body.version); });
    if (has_extrinsic(body.version)) {
        wr.write_u8_to_le(body.extrinsic.version);
        scale::write_text_vec(wr, body.extrinsic.signed_extensions);
    }
}

nlohmann::json to_json(const MetadataBody& body) {
    auto modules = nlohmann::json::array();
    for (const auto& mod: body.modules) {
        modules.push_back(module_to_json(mod, body.version));
    }

    nlohmann::json json = {{"modules", modules}};
    if (has_extrinsic(body.version)) {
        json["extrinsic"] = {{"version", body.extrinsic.version},
                             {"signedExtensions", body.extrinsic.signed_extensions}};
    }
    return json;
}
}  // namespace metaconf::legacy
