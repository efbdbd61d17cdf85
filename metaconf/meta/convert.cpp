#include "metaconf/meta/convert.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "metaconf/codec/type_expr.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf {
namespace {
using portable::LookupId;

/*
 * Append types to a portable registry, interning the historic ones
 * by their normalized expression.
 * */
class LookupBuilder {
public:
    LookupBuilder(portable::PortableRegistry& registry, unsigned version):
            registry(registry), version(version), next(registry.next_id()) {}

    LookupId intern(const std::string& expr) {
        std::string normalized;
        try {
            normalized = normalize_type_expr(expr);
        } catch (const DecodeError& err) {
            throw ConversionError(version, F() << "Type '" << expr << "' cannot be normalized. " << err.what());
        }

        auto it = historic.find(normalized);
        if (it != historic.end()) {
            return it->second;
        }

        portable::Type type;
        type.def.kind = portable::TypeDef::Kind::HistoricMetaCompat;
        type.def.historic = normalized;

        const LookupId id = add(std::move(type));
        historic[normalized] = id;
        return id;
    }

    LookupId add(portable::Type type) {
        const LookupId id = next++;
        registry.types.push_back({id, std::move(type)});
        return id;
    }

private:
    portable::PortableRegistry& registry;
    const unsigned version;
    LookupId next;
    std::map<std::string, LookupId> historic;
};

std::string tuple_expr(const std::vector<std::string>& elems) {
    if (elems.size() == 1) {
        return elems[0];
    }

    std::string expr = "(";
    for (size_t i = 0; i < elems.size(); ++i) {
        expr += (i ? ", " : "") + elems[i];
    }
    return expr + ")";
}

portable::Type make_variant_type(std::vector<std::string> path, std::vector<portable::Variant> variants) {
    portable::Type type;
    type.path = std::move(path);
    type.def.kind = portable::TypeDef::Kind::Variant;
    type.def.variants = std::move(variants);
    return type;
}

uint8_t variant_index(size_t pos, unsigned version) {
    if (pos > 255) {
        throw ConversionError(version, F() << "Too many variants (" << pos + 1 << ") for an u8 index.");
    }
    return uint8_t(pos);
}

portable::StorageEntry convert_entry(LookupBuilder& builder, const legacy::StorageEntry& entry, unsigned version) {
    portable::StorageEntry out;
    out.name = entry.name;
    out.modifier = entry.modifier;
    out.fallback = entry.fallback;
    out.docs = entry.docs;

    const auto& type = entry.type;
    switch (type.kind) {
        case legacy::StorageEntryType::Kind::Plain:
            out.kind = portable::StorageEntry::Kind::Plain;
            break;
        case legacy::StorageEntryType::Kind::Map:
            out.kind = portable::StorageEntry::Kind::Map;
            out.hashers = {type.hasher};
            out.key = builder.intern(type.key);
            break;
        case legacy::StorageEntryType::Kind::DoubleMap:
            out.kind = portable::StorageEntry::Kind::Map;
            out.hashers = {type.hasher, type.key2_hasher};
            out.key = builder.intern(tuple_expr({type.key, type.key2}));
            break;
        case legacy::StorageEntryType::Kind::NMap:
            if (type.keys.size() != type.hashers.size() or type.keys.empty()) {
                throw ConversionError(version, F() << "Storage item " << entry.name << " has " << type.keys.size()
                                                   << " keys but " << type.hashers.size() << " hashers.");
            }
            out.kind = portable::StorageEntry::Kind::Map;
            out.hashers = type.hashers;
            out.key = builder.intern(tuple_expr(type.keys));
            break;
    }

    out.value = builder.intern(type.value);
    return out;
}

std::optional<LookupId> convert_calls(LookupBuilder& builder, const legacy::Module& mod, unsigned version) {
    if (not mod.calls) {
        return std::nullopt;
    }

    std::vector<portable::Variant> variants;
    for (size_t i = 0; i < mod.calls->size(); ++i) {
        const auto& call = (*mod.calls)[i];
        portable::Variant variant{
                .name = call.name, .fields = {}, .index = variant_index(i, version), .docs = call.docs};
        for (const auto& arg: call.args) {
            variant.fields.push_back(
                    {.name = arg.name, .type = builder.intern(arg.type), .type_name = arg.type, .docs = {}});
        }
        variants.push_back(std::move(variant));
    }
    return builder.add(make_variant_type({mod.name, "Call"}, std::move(variants)));
}

std::optional<LookupId> convert_events(LookupBuilder& builder, const legacy::Module& mod, unsigned version) {
    if (not mod.events) {
        return std::nullopt;
    }

    std::vector<portable::Variant> variants;
    for (size_t i = 0; i < mod.events->size(); ++i) {
        const auto& event = (*mod.events)[i];
        portable::Variant variant{
                .name = event.name, .fields = {}, .index = variant_index(i, version), .docs = event.docs};
        for (const auto& arg: event.args) {
            variant.fields.push_back(
                    {.name = std::nullopt, .type = builder.intern(arg), .type_name = arg, .docs = {}});
        }
        variants.push_back(std::move(variant));
    }
    return builder.add(make_variant_type({mod.name, "Event"}, std::move(variants)));
}

std::optional<LookupId> convert_errors(LookupBuilder& builder, const legacy::Module& mod, unsigned version) {
    if (mod.errors.empty()) {
        return std::nullopt;
    }

    std::vector<portable::Variant> variants;
    for (size_t i = 0; i < mod.errors.size(); ++i) {
        const auto& error = mod.errors[i];
        variants.push_back(
                {.name = error.name, .fields = {}, .index = variant_index(i, version), .docs = error.docs});
    }
    return builder.add(make_variant_type({mod.name, "Error"}, std::move(variants)));
}

/*
 * Outer enum: one variant per pallet that has the given kind of type,
 * indexed by the pallet index.
 * */
LookupId build_outer_enum(LookupBuilder& builder, const std::vector<portable::Pallet>& pallets, const char* name,
                          std::optional<LookupId> portable::Pallet::*member) {
    std::vector<portable::Variant> variants;
    for (const auto& pallet: pallets) {
        const auto& id = pallet.*member;
        if (not id) {
            continue;
        }
        variants.push_back({.name = pallet.name,
                            .fields = {{.name = std::nullopt, .type = *id, .type_name = std::nullopt, .docs = {}}},
                            .index = pallet.index,
                            .docs = {}});
    }
    return builder.add(make_variant_type({name}, std::move(variants)));
}

std::optional<LookupId> find_by_path_tail(const portable::PortableRegistry& registry, const std::string& name) {
    for (const auto& ptype: registry.types) {
        if (not ptype.type.path.empty() and ptype.type.path.back() == name) {
            return ptype.id;
        }
    }
    return std::nullopt;
}

void set_outer_enums(LookupBuilder& builder, portable::MetadataBody& latest) {
    auto find_or_build = [&](const char* name, std::optional<LookupId> portable::Pallet::*member) {
        auto found = find_by_path_tail(latest.lookup, name);
        return found ? *found : build_outer_enum(builder, latest.pallets, name, member);
    };

    latest.outer_enums.call_type = find_or_build("RuntimeCall", &portable::Pallet::calls);
    latest.outer_enums.event_type = find_or_build("RuntimeEvent", &portable::Pallet::event);
    latest.outer_enums.error_type = find_or_build("RuntimeError", &portable::Pallet::error);
}
}  // namespace

portable::MetadataBody convert_to_latest(const legacy::MetadataBody& body) {
    const unsigned version = body.version;

    portable::MetadataBody latest;
    latest.version = 15;
    LookupBuilder builder(latest.lookup, version);

    for (size_t i = 0; i < body.modules.size(); ++i) {
        const auto& mod = body.modules[i];

        portable::Pallet pallet;
        pallet.name = mod.name;
        pallet.index = version >= 12 ? mod.index : variant_index(i, version);

        if (mod.storage) {
            portable::PalletStorage storage;
            storage.prefix = mod.storage->prefix;
            for (const auto& entry: mod.storage->items) {
                storage.items.push_back(convert_entry(builder, entry, version));
            }
            pallet.storage = std::move(storage);
        }

        pallet.calls = convert_calls(builder, mod, version);
        pallet.event = convert_events(builder, mod, version);

        for (const auto& constant: mod.constants) {
            pallet.constants.push_back({.name = constant.name,
                                        .type = builder.intern(constant.type),
                                        .value = constant.value,
                                        .docs = constant.docs});
        }

        pallet.error = convert_errors(builder, mod, version);
        latest.pallets.push_back(std::move(pallet));
    }

    latest.extrinsic.type = builder.intern("UncheckedExtrinsic");
    latest.extrinsic.version = body.extrinsic.version;
    for (const auto& identifier: body.extrinsic.signed_extensions) {
        latest.extrinsic.signed_extensions.push_back({.identifier = identifier,
                                                      .type = builder.intern(identifier),
                                                      .additional_signed = builder.intern("Null")});
    }

    latest.type = builder.intern("Runtime");

    // Legacy metadata never carries its own outer enums
    latest.outer_enums.call_type =
            build_outer_enum(builder, latest.pallets, "RuntimeCall", &portable::Pallet::calls);
    latest.outer_enums.event_type =
            build_outer_enum(builder, latest.pallets, "RuntimeEvent", &portable::Pallet::event);
    latest.outer_enums.error_type =
            build_outer_enum(builder, latest.pallets, "RuntimeError", &portable::Pallet::error);

    TRACE_ON(METACONF_TRACE_CONVERT) << "converted v" << version << " to v15: " << latest.pallets.size()
                                     << " pallets, " << latest.lookup.types.size() << " types" << TRACE_ENDL;
    return latest;
}

portable::MetadataBody convert_to_latest(const portable::MetadataBody& body) {
    if (body.version != 14) {
        throw ConversionError(body.version, F() << "Only v14 portable metadata can be converted.");
    }

    portable::MetadataBody latest = body;
    latest.version = 15;

    LookupBuilder builder(latest.lookup, body.version);
    set_outer_enums(builder, latest);

    TRACE_ON(METACONF_TRACE_CONVERT) << "converted v14 to v15: " << latest.lookup.types.size() << " types"
                                     << TRACE_ENDL;
    return latest;
}

portable::MetadataBody to_calls_only(const portable::MetadataBody& latest) {
    portable::MetadataBody reduced;
    reduced.version = 15;
    reduced.lookup = latest.lookup;
    reduced.extrinsic = latest.extrinsic;
    reduced.type = latest.type;
    reduced.outer_enums = latest.outer_enums;

    for (const auto& pallet: latest.pallets) {
        portable::Pallet kept;
        kept.name = pallet.name;
        kept.index = pallet.index;
        kept.calls = pallet.calls;
        reduced.pallets.push_back(std::move(kept));
    }
    return reduced;
}
}  // namespace metaconf
