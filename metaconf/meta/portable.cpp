#include "metaconf/meta/portable.h"

#include <string>
#include <utility>

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf::portable {
namespace {
bool has_v15_fields(uint8_t version) { return version >= 15; }

std::optional<LookupId> read_opt_id(IOBase& io) { return scale::read_option<LookupId>(io, read_lookup_id); }

void write_opt_id(Writer& wr, const std::optional<LookupId>& id) {
    scale::write_option<LookupId>(wr, id, write_lookup_id);
}

nlohmann::json opt_id_to_json(const std::optional<LookupId>& id) {
    return id ? nlohmann::json({{"type", *id}}) : nlohmann::json(nullptr);
}

StorageEntry read_entry(IOBase& io) {
    StorageEntry entry;
    entry.name = scale::read_text(io);
    entry.modifier = read_storage_modifier(io);

    const uint32_t at = io.tell_rd();
    const uint8_t kind = scale::read_u8(io);
    entry.kind = StorageEntry::Kind(kind);
    switch (entry.kind) {
        case StorageEntry::Kind::Plain:
            entry.value = read_lookup_id(io);
            break;
        case StorageEntry::Kind::Map:
            entry.hashers = scale::read_vec<StorageHasher>(io, read_storage_hasher);
            entry.key = read_lookup_id(io);
            entry.value = read_lookup_id(io);
            break;
        default:
            throw DecodeError(at, F() << "Unknown storage entry type " << int(kind) << ".");
    }

    entry.fallback = scale::read_bytes(io);
    entry.docs = scale::read_text_vec(io);
    return entry;
}

void write_entry(Writer& wr, const StorageEntry& entry) {
    wr.write_text(entry.name);
    write_storage_modifier(wr, entry.modifier);
    wr.write_u8_to_le(uint8_t(entry.kind));
    if (entry.kind == StorageEntry::Kind::Map) {
        scale::write_vec<StorageHasher>(wr, entry.hashers, write_storage_hasher);
        write_lookup_id(wr, entry.key);
    }
    write_lookup_id(wr, entry.value);
    wr.write_bytes(entry.fallback);
    scale::write_text_vec(wr, entry.docs);
}

PalletStorage read_storage(IOBase& io) {
    PalletStorage storage;
    storage.prefix = scale::read_text(io);
    storage.items = scale::read_vec<StorageEntry>(io, read_entry);
    return storage;
}

PalletConstant read_constant(IOBase& io) {
    PalletConstant constant;
    constant.name = scale::read_text(io);
    constant.type = read_lookup_id(io);
    constant.value = scale::read_bytes(io);
    constant.docs = scale::read_text_vec(io);
    return constant;
}

Pallet read_pallet(IOBase& io, uint8_t version) {
    Pallet pallet;
    pallet.name = scale::read_text(io);
    pallet.storage = scale::read_option<PalletStorage>(io, read_storage);
    pallet.calls = read_opt_id(io);
    pallet.event = read_opt_id(io);
    pallet.constants = scale::read_vec<PalletConstant>(io, read_constant);
    pallet.error = read_opt_id(io);
    pallet.index = scale::read_u8(io);
    if (has_v15_fields(version)) {
        pallet.docs = scale::read_text_vec(io);
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "pallet " << pallet.name << " ("
                                   << (pallet.storage ? pallet.storage->items.size() : 0) << " storage items)"
                                   << TRACE_ENDL;
    return pallet;
}

void write_pallet(Writer& wr, const Pallet& pallet, uint8_t version) {
    wr.write_text(pallet.name);
    scale::write_option<PalletStorage>(wr, pallet.storage, [](Writer& w, const PalletStorage& storage) {
        w.write_text(storage.prefix);
        scale::write_vec<StorageEntry>(w, storage.items, write_entry);
    });
    write_opt_id(wr, pallet.calls);
    write_opt_id(wr, pallet.event);
    scale::write_vec<PalletConstant>(wr, pallet.constants, [](Writer& w, const PalletConstant& constant) {
        w.write_text(constant.name);
        write_lookup_id(w, constant.type);
        w.write_bytes(constant.value);
        scale::write_text_vec(w, constant.docs);
    });
    write_opt_id(wr, pallet.error);
    wr.write_u8_to_le(pallet.index);
    if (has_v15_fields(version)) {
        scale::write_text_vec(wr, pallet.docs);
    }
}

SignedExtension read_signed_extension(IOBase& io) {
    SignedExtension ext;
    ext.identifier = scale::read_text(io);
    ext.type = read_lookup_id(io);
    ext.additional_signed = read_lookup_id(io);
    return ext;
}

RuntimeApiParam read_api_param(IOBase& io) {
    RuntimeApiParam param;
    param.name = scale::read_text(io);
    param.type = read_lookup_id(io);
    return param;
}

RuntimeApiMethod read_api_method(IOBase& io) {
    RuntimeApiMethod method;
    method.name = scale::read_text(io);
    method.inputs = scale::read_vec<RuntimeApiParam>(io, read_api_param);
    method.output = read_lookup_id(io);
    method.docs = scale::read_text_vec(io);
    return method;
}

RuntimeApi read_api(IOBase& io) {
    RuntimeApi api;
    api.name = scale::read_text(io);
    api.methods = scale::read_vec<RuntimeApiMethod>(io, read_api_method);
    api.docs = scale::read_text_vec(io);
    return api;
}

void write_api(Writer& wr, const RuntimeApi& api) {
    wr.write_text(api.name);
    scale::write_vec<RuntimeApiMethod>(wr, api.methods, [](Writer& w, const RuntimeApiMethod& method) {
        w.write_text(method.name);
        scale::write_vec<RuntimeApiParam>(w, method.inputs, [](Writer& w, const RuntimeApiParam& param) {
            w.write_text(param.name);
            write_lookup_id(w, param.type);
        });
        write_lookup_id(w, method.output);
        scale::write_text_vec(w, method.docs);
    });
    scale::write_text_vec(wr, api.docs);
}

nlohmann::json entry_to_json(const StorageEntry& entry) {
    nlohmann::json type;
    if (entry.kind == StorageEntry::Kind::Plain) {
        type = {{"plain", entry.value}};
    } else {
        auto hashers = nlohmann::json::array();
        for (auto hasher: entry.hashers) {
            hashers.push_back(storage_hasher_to_json(hasher));
        }
        type = {{"map", {{"hashers", hashers}, {"key", entry.key}, {"value", entry.value}}}};
    }

    return {{"name", entry.name},
            {"modifier", storage_modifier_to_json(entry.modifier)},
            {"type", type},
            {"fallback", to_hex(entry.fallback)},
            {"docs", entry.docs}};
}

nlohmann::json pallet_to_json(const Pallet& pallet, uint8_t version) {
    nlohmann::json storage = nullptr;
    if (pallet.storage) {
        auto items = nlohmann::json::array();
        for (const auto& entry: pallet.storage->items) {
            items.push_back(entry_to_json(entry));
        }
        storage = {{"prefix", pallet.storage->prefix}, {"items", items}};
    }

    auto constants = nlohmann::json::array();
    for (const auto& constant: pallet.constants) {
        constants.push_back({{"name", constant.name},
                             {"type", constant.type},
                             {"value", to_hex(constant.value)},
                             {"docs", constant.docs}});
    }

    nlohmann::json json = {{"name", pallet.name},
                           {"storage", storage},
                           {"calls", opt_id_to_json(pallet.calls)},
                           {"events", opt_id_to_json(pallet.event)},
                           {"constants", constants},
                           {"errors", opt_id_to_json(pallet.error)},
                           {"index", pallet.index}};
    if (has_v15_fields(version)) {
        json["docs"] = pallet.docs;
    }
    return json;
}

nlohmann::json api_to_json(const RuntimeApi& api) {
    auto methods = nlohmann::json::array();
    for (const auto& method: api.methods) {
        auto inputs = nlohmann::json::array();
        for (const auto& param: method.inputs) {
            inputs.push_back({{"name", param.name}, {"type", param.type}});
        }
        methods.push_back(
                {{"name", method.name}, {"inputs", inputs}, {"output", method.output}, {"docs", method.docs}});
    }
    return {{"name", api.name}, {"methods", methods}, {"docs", api.docs}};
}
}  // namespace

MetadataBody read_body(IOBase& io, uint8_t version) {
    if (version != 14 and version != 15) {
        throw InternalError(F() << "Portable metadata body of unsupported version " << int(version) << ".");
    }

    MetadataBody body;
    body.version = version;
    body.lookup = read_registry(io);
    body.pallets = scale::read_vec<Pallet>(io, [version](IOBase& io) { return read_pallet(io, version); });

    body.extrinsic.type = read_lookup_id(io);
    body.extrinsic.version = scale::read_u8(io);
    body.extrinsic.signed_extensions = scale::read_vec<SignedExtension>(io, read_signed_extension);

    body.type = read_lookup_id(io);

    if (has_v15_fields(version)) {
        body.apis = scale::read_vec<RuntimeApi>(io, read_api);
        body.outer_enums.call_type = read_lookup_id(io);
        body.outer_enums.event_type = read_lookup_id(io);
        body.outer_enums.error_type = read_lookup_id(io);
    }
    return body;
}

void write_body(Writer& wr, const MetadataBody& body) {
    write_registry(wr, body.lookup);
    scale::write_vec<Pallet>(wr, body.pallets,
                             [&body](Writer& w, const Pallet& pallet) { write_pallet(w, pallet, body.version); });

    write_lookup_id(wr, body.extrinsic.type);
    wr.write_u8_to_le(body.extrinsic.version);
    scale::write_vec<SignedExtension>(wr, body.extrinsic.signed_extensions,
                                      [](Writer& w, const SignedExtension& ext) {
                                          w.write_text(ext.identifier);
                                          write_lookup_id(w, ext.type);
                                          write_lookup_id(w, ext.additional_signed);
                                      });

    write_lookup_id(wr, body.type);

    if (has_v15_fields(body.version)) {
        scale::write_vec<RuntimeApi>(wr, body.apis, write_api);
        write_lookup_id(wr, body.outer_enums.call_type);
        write_lookup_id(wr, body.outer_enums.event_type);
        write_lookup_id(wr, body.outer_enums.error_type);
    }
}

nlohmann::json to_json(const MetadataBody& body) {
    auto pallets = nlohmann::json::array();
    for (const auto& pallet: body.pallets) {
        pallets.push_back(pallet_to_json(pallet, body.version));
    }

    auto signed_extensions = nlohmann::json::array();
    for (const auto& ext: body.extrinsic.signed_extensions) {
        signed_extensions.push_back(
                {{"identifier", ext.identifier}, {"type", ext.type}, {"additionalSigned", ext.additional_signed}});
    }

    nlohmann::json json = {
            {"lookup", to_json(body.lookup)},
            {"pallets", pallets},
            {"extrinsic",
             {{"type", body.extrinsic.type},
              {"version", body.extrinsic.version},
              {"signedExtensions", signed_extensions}}},
            {"type", body.type},
    };

    if (has_v15_fields(body.version)) {
        auto apis = nlohmann::json::array();
        for (const auto& api: body.apis) {
            apis.push_back(api_to_json(api));
        }
        json["apis"] = apis;
        json["outerEnums"] = {{"callType", body.outer_enums.call_type},
                              {"eventType", body.outer_enums.event_type},
                              {"errorType", body.outer_enums.error_type}};
    }
    return json;
}
}  // namespace metaconf::portable
