#include "metaconf/codec/schema_context.h"

#include <utility>
#include <vector>

#include "metaconf/codec/registry.h"
#include "metaconf/codec/type_expr.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"
#include "metaconf/meta/naming.h"

namespace metaconf {
namespace {
const unsigned MAX_REFERENCE_CHAIN = 64;

bool is_u8(const portable::PortableRegistry& lookup, portable::LookupId id) {
    const auto& def = lookup.at(id).def;
    return def.kind == portable::TypeDef::Kind::Primitive and def.primitive == Primitive::U8;
}

bool is_option(const portable::Type& type) {
    if (type.path.empty() or type.path.back() != "Option") {
        return false;
    }

    const auto& variants = type.def.variants;
    return variants.size() == 2 and variants[0].name == "None" and variants[0].fields.empty() and
           variants[1].name == "Some" and variants[1].fields.size() == 1;
}

std::vector<TypeNode::field_t> to_fields(const std::vector<portable::Field>& fields) {
    std::vector<TypeNode::field_t> out;
    for (const auto& field: fields) {
        out.push_back({field.name.value_or(""), TypeNode::make_lookup(field.type)});
    }
    return out;
}
}  // namespace

SchemaContext::SchemaContext(const TypeRegistry& registry, std::shared_ptr<const Metadata> metadata):
        reg(&registry), meta(std::move(metadata)) {}

const Metadata& SchemaContext::metadata() const {
    if (not meta) {
        throw InternalError(F() << "No metadata is bound to the schema context.");
    }
    return *meta;
}

const portable::PortableRegistry& SchemaContext::lookup() const { return metadata().as_latest().lookup; }

std::string SchemaContext::type_name(portable::LookupId id) const { return portable::lookup_type_name(lookup(), id); }

TypeNodePtr SchemaContext::resolve_type(portable::LookupId id) const {
    const auto& lk = lookup();
    const portable::Type& type = lk.at(id);
    const portable::TypeDef& def = type.def;
    const std::string name = type.path.empty() ? "" : type_name(id);

    switch (def.kind) {
        case portable::TypeDef::Kind::Composite:
            return TypeNode::make_composite(name, to_fields(def.fields));

        case portable::TypeDef::Kind::Variant: {
            if (is_option(type)) {
                return TypeNode::make_option(TypeNode::make_lookup(def.variants[1].fields[0].type));
            }

            std::vector<TypeNode::variant_t> variants;
            for (const auto& variant: def.variants) {
                variants.push_back({variant.name, variant.index, to_fields(variant.fields)});
            }
            return TypeNode::make_variant(name, std::move(variants));
        }

        case portable::TypeDef::Kind::Sequence:
            if (is_u8(lk, def.type)) {
                return TypeNode::make_bytes();
            }
            return TypeNode::make_sequence(TypeNode::make_lookup(def.type));

        case portable::TypeDef::Kind::Array:
            return TypeNode::make_array(TypeNode::make_lookup(def.type), def.len);

        case portable::TypeDef::Kind::Tuple: {
            if (def.tuple.empty()) {
                return TypeNode::make_null();
            }
            std::vector<TypeNodePtr> elems;
            for (auto elem: def.tuple) {
                elems.push_back(TypeNode::make_lookup(elem));
            }
            return TypeNode::make_tuple(std::move(elems));
        }

        case portable::TypeDef::Kind::Primitive:
            return TypeNode::make_primitive(def.primitive);

        case portable::TypeDef::Kind::Compact:
            return TypeNode::make_compact(TypeNode::make_lookup(def.type));

        case portable::TypeDef::Kind::BitSequence:
            return TypeNode::make_bit_sequence();

        case portable::TypeDef::Kind::HistoricMetaCompat:
            return parse_type_expr(def.historic);
    }
    throw InternalError(F() << "Unknown type definition kind " << int(def.kind) << " for lookup " << id << ".");
}

TypeNodePtr SchemaContext::resolve(const TypeNodePtr& node) const {
    TypeNodePtr cur = node;
    for (unsigned i = 0; i < MAX_REFERENCE_CHAIN; ++i) {
        switch (cur->kind) {
            case TypeNode::Kind::Lookup:
                cur = resolve_type(cur->len);
                break;
            case TypeNode::Kind::Named:
                cur = reg->resolve_named(cur->name);
                break;
            default:
                return cur;
        }
    }

    throw DecodeError(F() << "Type " << node->display() << " does not resolve to a concrete type after "
                          << MAX_REFERENCE_CHAIN << " references (loop?).");
}
}  // namespace metaconf
