#include "metaconf/meta/si.h"

#include <string>
#include <utility>

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf::portable {
namespace {
std::optional<std::string> read_opt_text(IOBase& io) { return scale::read_option<std::string>(io, scale::read_text); }

void write_opt_text(Writer& wr, const std::optional<std::string>& text) {
    scale::write_option<std::string>(wr, text, [](Writer& w, const std::string& t) { w.write_text(t); });
}

nlohmann::json opt_text_to_json(const std::optional<std::string>& text) {
    return text ? nlohmann::json(*text) : nlohmann::json(nullptr);
}

Field read_field(IOBase& io) {
    Field field;
    field.name = read_opt_text(io);
    field.type = read_lookup_id(io);
    field.type_name = read_opt_text(io);
    field.docs = scale::read_text_vec(io);
    return field;
}

void write_field(Writer& wr, const Field& field) {
    write_opt_text(wr, field.name);
    write_lookup_id(wr, field.type);
    write_opt_text(wr, field.type_name);
    scale::write_text_vec(wr, field.docs);
}

std::vector<Field> read_fields(IOBase& io) { return scale::read_vec<Field>(io, read_field); }

void write_fields(Writer& wr, const std::vector<Field>& fields) { scale::write_vec<Field>(wr, fields, write_field); }

Variant read_variant(IOBase& io) {
    Variant variant;
    variant.name = scale::read_text(io);
    variant.fields = read_fields(io);
    variant.index = scale::read_u8(io);
    variant.docs = scale::read_text_vec(io);
    return variant;
}

void write_variant(Writer& wr, const Variant& variant) {
    wr.write_text(variant.name);
    write_fields(wr, variant.fields);
    wr.write_u8_to_le(variant.index);
    scale::write_text_vec(wr, variant.docs);
}

TypeParam read_param(IOBase& io) {
    TypeParam param;
    param.name = scale::read_text(io);
    param.type = scale::read_option<LookupId>(io, read_lookup_id);
    return param;
}

void write_param(Writer& wr, const TypeParam& param) {
    wr.write_text(param.name);
    scale::write_option<LookupId>(wr, param.type, write_lookup_id);
}

TypeDef read_typedef(IOBase& io) {
    const uint32_t at = io.tell_rd();
    const uint8_t kind = scale::read_u8(io);

    TypeDef def;
    def.kind = TypeDef::Kind(kind);
    switch (def.kind) {
        case TypeDef::Kind::Composite:
            def.fields = read_fields(io);
            break;
        case TypeDef::Kind::Variant:
            def.variants = scale::read_vec<Variant>(io, read_variant);
            break;
        case TypeDef::Kind::Sequence:
        case TypeDef::Kind::Compact:
            def.type = read_lookup_id(io);
            break;
        case TypeDef::Kind::Array:
            def.len = scale::read_u32(io);
            def.type = read_lookup_id(io);
            break;
        case TypeDef::Kind::Tuple:
            def.tuple = scale::read_vec<LookupId>(io, read_lookup_id);
            break;
        case TypeDef::Kind::Primitive: {
            const uint32_t prim_at = io.tell_rd();
            const uint8_t prim = scale::read_u8(io);
            if (prim > PRIMITIVE_MAX_INDEX) {
                throw DecodeError(prim_at, F() << "Unknown primitive type " << int(prim) << ".");
            }
            def.primitive = Primitive(prim);
            break;
        }
        case TypeDef::Kind::BitSequence:
            def.type = read_lookup_id(io);
            def.order_type = read_lookup_id(io);
            break;
        case TypeDef::Kind::HistoricMetaCompat:
            def.historic = scale::read_text(io);
            break;
        default:
            throw DecodeError(at, F() << "Unknown type definition kind " << int(kind) << ".");
    }
    return def;
}

Type read_type(IOBase& io) {
    Type type;
    type.path = scale::read_text_vec(io);
    type.params = scale::read_vec<TypeParam>(io, read_param);
    type.def = read_typedef(io);
    type.docs = scale::read_text_vec(io);
    return type;
}

PortableType read_portable_type(IOBase& io) {
    PortableType ptype;
    ptype.id = read_lookup_id(io);
    ptype.type = read_type(io);
    return ptype;
}
}  // namespace

const Type* PortableRegistry::find(LookupId id) const {
    // The ids are usually the positions in the registry
    if (id < types.size() and types[id].id == id) {
        return &types[id].type;
    }

    for (const auto& ptype: types) {
        if (ptype.id == id) {
            return &ptype.type;
        }
    }
    return nullptr;
}

const Type& PortableRegistry::at(LookupId id) const {
    const Type* type = find(id);
    if (not type) {
        throw DecodeError(F() << "Lookup id " << id << " not found in a registry of " << types.size() << " types.");
    }
    return *type;
}

LookupId PortableRegistry::next_id() const {
    LookupId next = 0;
    for (const auto& ptype: types) {
        if (ptype.id >= next) {
            next = ptype.id + 1;
        }
    }
    return next;
}

const char* typedef_kind_name(TypeDef::Kind kind) {
    switch (kind) {
        case TypeDef::Kind::Composite:
            return "composite";
        case TypeDef::Kind::Variant:
            return "variant";
        case TypeDef::Kind::Sequence:
            return "sequence";
        case TypeDef::Kind::Array:
            return "array";
        case TypeDef::Kind::Tuple:
            return "tuple";
        case TypeDef::Kind::Primitive:
            return "primitive";
        case TypeDef::Kind::Compact:
            return "compact";
        case TypeDef::Kind::BitSequence:
            return "bitSequence";
        case TypeDef::Kind::HistoricMetaCompat:
            return "historicMetaCompat";
    }
    throw InternalError(F() << "Unknown type definition kind " << int(kind) << ".");
}

PortableRegistry read_registry(IOBase& io) {
    PortableRegistry registry;
    registry.types = scale::read_vec<PortableType>(io, read_portable_type);

    TRACE_ON(METACONF_TRACE_CODEC) << "lookup: " << registry.types.size() << " types" << TRACE_ENDL;
    return registry;
}

void write_typedef(Writer& wr, const TypeDef& def) {
    wr.write_u8_to_le(uint8_t(def.kind));
    switch (def.kind) {
        case TypeDef::Kind::Composite:
            write_fields(wr, def.fields);
            break;
        case TypeDef::Kind::Variant:
            scale::write_vec<Variant>(wr, def.variants, write_variant);
            break;
        case TypeDef::Kind::Sequence:
        case TypeDef::Kind::Compact:
            write_lookup_id(wr, def.type);
            break;
        case TypeDef::Kind::Array:
            wr.write_u32_to_le(def.len);
            write_lookup_id(wr, def.type);
            break;
        case TypeDef::Kind::Tuple:
            scale::write_vec<LookupId>(wr, def.tuple, write_lookup_id);
            break;
        case TypeDef::Kind::Primitive:
            wr.write_u8_to_le(uint8_t(def.primitive));
            break;
        case TypeDef::Kind::BitSequence:
            write_lookup_id(wr, def.type);
            write_lookup_id(wr, def.order_type);
            break;
        case TypeDef::Kind::HistoricMetaCompat:
            wr.write_text(def.historic);
            break;
        default:
            throw InternalError(F() << "Unknown type definition kind " << int(def.kind) << ".");
    }
}

void write_registry(Writer& wr, const PortableRegistry& registry) {
    scale::write_vec<PortableType>(wr, registry.types, [](Writer& w, const PortableType& ptype) {
        write_lookup_id(w, ptype.id);
        scale::write_text_vec(w, ptype.type.path);
        scale::write_vec<TypeParam>(w, ptype.type.params, write_param);
        write_typedef(w, ptype.type.def);
        scale::write_text_vec(w, ptype.type.docs);
    });
}

LookupId read_lookup_id(IOBase& io) { return scale::read_compact_u32(io); }

void write_lookup_id(Writer& wr, LookupId id) { wr.write_compact(uint64_t(id)); }

nlohmann::json to_json(const Field& field) {
    return {{"name", opt_text_to_json(field.name)},
            {"type", field.type},
            {"typeName", opt_text_to_json(field.type_name)},
            {"docs", field.docs}};
}

nlohmann::json to_json(const Variant& variant) {
    auto fields = nlohmann::json::array();
    for (const auto& field: variant.fields) {
        fields.push_back(to_json(field));
    }
    return {{"name", variant.name}, {"fields", fields}, {"index", variant.index}, {"docs", variant.docs}};
}

nlohmann::json to_json(const TypeDef& def) {
    nlohmann::json val;
    switch (def.kind) {
        case TypeDef::Kind::Composite: {
            auto fields = nlohmann::json::array();
            for (const auto& field: def.fields) {
                fields.push_back(to_json(field));
            }
            val = {{"fields", fields}};
            break;
        }
        case TypeDef::Kind::Variant: {
            auto variants = nlohmann::json::array();
            for (const auto& variant: def.variants) {
                variants.push_back(to_json(variant));
            }
            val = {{"variants", variants}};
            break;
        }
        case TypeDef::Kind::Sequence:
        case TypeDef::Kind::Compact:
            val = {{"type", def.type}};
            break;
        case TypeDef::Kind::Array:
            val = {{"len", def.len}, {"type", def.type}};
            break;
        case TypeDef::Kind::Tuple:
            val = def.tuple;
            break;
        case TypeDef::Kind::Primitive:
            val = primitive_json_name(def.primitive);
            break;
        case TypeDef::Kind::BitSequence:
            val = {{"bitStoreType", def.type}, {"bitOrderType", def.order_type}};
            break;
        case TypeDef::Kind::HistoricMetaCompat:
            val = def.historic;
            break;
    }
    return {{typedef_kind_name(def.kind), val}};
}

nlohmann::json to_json(const Type& type) {
    auto params = nlohmann::json::array();
    for (const auto& param: type.params) {
        const nlohmann::json type = param.type ? nlohmann::json(*param.type) : nlohmann::json(nullptr);
        params.push_back({{"name", param.name}, {"type", type}});
    }
    return {{"path", type.path}, {"params", params}, {"def", to_json(type.def)}, {"docs", type.docs}};
}

nlohmann::json to_json(const PortableRegistry& registry) {
    auto types = nlohmann::json::array();
    for (const auto& ptype: registry.types) {
        types.push_back({{"id", ptype.id}, {"type", to_json(ptype.type)}});
    }
    return {{"types", types}};
}
}  // namespace metaconf::portable
