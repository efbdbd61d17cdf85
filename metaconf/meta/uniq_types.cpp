#include "metaconf/meta/uniq_types.h"

#include <deque>
#include <set>
#include <utility>

#include "metaconf/codec/writer.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"
#include "metaconf/meta/naming.h"

namespace metaconf::portable {
namespace {
std::vector<LookupId> root_ids(const MetadataBody& latest) {
    std::vector<LookupId> roots;
    for (const auto& pallet: latest.pallets) {
        if (pallet.storage) {
            for (const auto& entry: pallet.storage->items) {
                if (entry.kind == StorageEntry::Kind::Map) {
                    roots.push_back(entry.key);
                }
                roots.push_back(entry.value);
            }
        }
        for (const auto& id: {pallet.calls, pallet.event, pallet.error}) {
            if (id) {
                roots.push_back(*id);
            }
        }
        for (const auto& constant: pallet.constants) {
            roots.push_back(constant.type);
        }
    }

    roots.push_back(latest.extrinsic.type);
    for (const auto& ext: latest.extrinsic.signed_extensions) {
        roots.push_back(ext.type);
        roots.push_back(ext.additional_signed);
    }

    roots.push_back(latest.type);

    for (const auto& api: latest.apis) {
        for (const auto& method: api.methods) {
            for (const auto& param: method.inputs) {
                roots.push_back(param.type);
            }
            roots.push_back(method.output);
        }
    }

    roots.push_back(latest.outer_enums.call_type);
    roots.push_back(latest.outer_enums.event_type);
    roots.push_back(latest.outer_enums.error_type);
    return roots;
}

void push_children(const Type& type, std::deque<LookupId>& pending) {
    for (const auto& param: type.params) {
        if (param.type) {
            pending.push_back(*param.type);
        }
    }

    const TypeDef& def = type.def;
    switch (def.kind) {
        case TypeDef::Kind::Composite:
            for (const auto& field: def.fields) {
                pending.push_back(field.type);
            }
            break;
        case TypeDef::Kind::Variant:
            for (const auto& variant: def.variants) {
                for (const auto& field: variant.fields) {
                    pending.push_back(field.type);
                }
            }
            break;
        case TypeDef::Kind::Sequence:
        case TypeDef::Kind::Array:
        case TypeDef::Kind::Compact:
            pending.push_back(def.type);
            break;
        case TypeDef::Kind::Tuple:
            pending.insert(pending.end(), def.tuple.begin(), def.tuple.end());
            break;
        case TypeDef::Kind::BitSequence:
            pending.push_back(def.type);
            pending.push_back(def.order_type);
            break;
        case TypeDef::Kind::Primitive:
        case TypeDef::Kind::HistoricMetaCompat:
            break;
    }
}

bytes_t encoded_def(const TypeDef& def) {
    Writer wr;
    write_typedef(wr, def);
    return wr.take();
}
}  // namespace

uniq_types_t get_uniq_types(const MetadataBody& latest, bool with_throw) {
    uniq_types_t result;
    std::map<std::string, bytes_t> defs;

    std::set<LookupId> seen;
    std::deque<LookupId> pending;
    const auto roots = root_ids(latest);
    pending.insert(pending.end(), roots.begin(), roots.end());

    while (not pending.empty()) {
        const LookupId id = pending.front();
        pending.pop_front();
        if (not seen.insert(id).second) {
            continue;
        }

        const Type* type = latest.lookup.find(id);
        if (not type) {
            throw ConversionError(latest.version,
                                  F() << "Type " << id << " is referenced but it is not in the lookup.");
        }
        push_children(*type, pending);

        const auto name = lookup_type_identity(latest.lookup, id);
        if (not name) {
            continue;
        }

        auto def = encoded_def(type->def);
        auto it = result.types.find(*name);
        if (it == result.types.end()) {
            result.types[*name] = id;
            defs[*name] = std::move(def);
            continue;
        }

        if (defs[*name] == def) {
            continue;
        }

        if (with_throw) {
            throw TypeCollision(*name, it->second, id, F() << "Both are reachable from the latest metadata.");
        }

        TRACE_ON(METACONF_TRACE_CONVERT) << "type collision " << *name << ": " << it->second << " and " << id
                                         << TRACE_ENDL;
        result.collisions.push_back({.name = *name, .first = it->second, .second = id});
    }

    return result;
}
}  // namespace metaconf::portable
