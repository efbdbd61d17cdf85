#include "metaconf/codec/registry.h"

#include <utility>
#include <vector>

#include "metaconf/codec/type_expr.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf {
namespace {
TypeNodePtr parse_field_type(const std::string& type_name, const std::string& field,
                             const nlohmann::ordered_json& val) {
    if (not val.is_string()) {
        throw DecodeError(F() << "Field '" << field << "' of type '" << type_name
                              << "' must be a type expression, not " << val.type_name() << ".");
    }
    return parse_type_expr(val.get<std::string>());
}

std::vector<TypeNode::field_t> parse_struct(const std::string& type_name, const nlohmann::ordered_json& obj) {
    std::vector<TypeNode::field_t> fields;
    for (const auto& [field, val]: obj.items()) {
        fields.push_back({field, parse_field_type(type_name, field, val)});
    }
    return fields;
}

TypeNodePtr parse_enum(const std::string& type_name, const nlohmann::ordered_json& def) {
    std::vector<TypeNode::variant_t> variants;
    if (def.size() > 256) {
        throw DecodeError(F() << "Enum '" << type_name << "' has " << def.size() << " variants, more than 256.");
    }

    if (def.is_array()) {
        uint8_t index = 0;
        for (const auto& name: def) {
            if (not name.is_string()) {
                throw DecodeError(F() << "Variant names of enum '" << type_name << "' must be strings.");
            }
            variants.push_back({name.get<std::string>(), index++, {}});
        }
        return TypeNode::make_variant(type_name, std::move(variants));
    }

    if (not def.is_object()) {
        throw DecodeError(F() << "The _enum of type '" << type_name << "' must be an object or an array.");
    }

    uint8_t index = 0;
    for (const auto& [name, val]: def.items()) {
        TypeNode::variant_t variant{name, index++, {}};
        if (val.is_null() or (val.is_string() and val.get<std::string>() == "Null")) {
            // no fields
        } else if (val.is_string()) {
            variant.fields.push_back({"", parse_type_expr(val.get<std::string>())});
        } else if (val.is_object()) {
            variant.fields = parse_struct(type_name, val);
        } else {
            throw DecodeError(F() << "Variant '" << name << "' of enum '" << type_name
                                  << "' must be a type expression or a struct.");
        }
        variants.push_back(std::move(variant));
    }
    return TypeNode::make_variant(type_name, std::move(variants));
}

TypeNodePtr parse_definition(const std::string& type_name, const nlohmann::ordered_json& def) {
    if (def.is_string()) {
        return parse_type_expr(def.get<std::string>());
    }

    if (not def.is_object()) {
        throw DecodeError(F() << "Definition of type '" << type_name << "' must be a string or an object, not "
                              << def.type_name() << ".");
    }

    if (def.contains("_enum")) {
        return parse_enum(type_name, def["_enum"]);
    }

    for (const auto& [key, val]: def.items()) {
        if (key.starts_with("_")) {
            throw DecodeError(F() << "Definition of type '" << type_name << "' uses the unsupported '" << key
                                  << "'.");
        }
    }

    return TypeNode::make_composite(type_name, parse_struct(type_name, def));
}
}  // namespace

TypeRegistry::TypeRegistry() { register_definitions(std::string(base_type_definitions())); }

void TypeRegistry::register_definitions(const nlohmann::ordered_json& defs) {
    if (not defs.is_object()) {
        throw DecodeError(F() << "Type definitions must be a JSON object, not " << defs.type_name() << ".");
    }

    std::map<std::string, TypeNodePtr> parsed;
    for (const auto& [name, def]: defs.items()) {
        try {
            parsed[name] = parse_definition(name, def);
        } catch (const DecodeError& err) {
            throw DecodeError(F() << "Invalid definition of type '" << name << "'. " << err.what());
        }
    }

    for (auto& [name, node]: parsed) {
        definitions[name] = std::move(node);
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "registered " << parsed.size() << " type definitions" << TRACE_ENDL;
}

void TypeRegistry::register_definitions(const std::string& json_text) {
    nlohmann::ordered_json defs;
    try {
        defs = nlohmann::ordered_json::parse(json_text);
    } catch (const nlohmann::ordered_json::parse_error& err) {
        throw DecodeError(F() << "Type definitions are not valid JSON. " << err.what());
    }
    register_definitions(defs);
}

bool TypeRegistry::has_definition(const std::string& name) const { return definitions.contains(name); }

TypeNodePtr TypeRegistry::resolve_named(const std::string& name) const {
    auto it = definitions.find(name);
    if (it != definitions.end()) {
        return it->second;
    }

    const auto generics = name.find('<');
    if (generics != std::string::npos) {
        it = definitions.find(name.substr(0, generics));
        if (it != definitions.end()) {
            return it->second;
        }
    }

    throw DecodeError(F() << "Unable to resolve type " << name << ", it is not a known type name.");
}

SchemaContext TypeRegistry::set_active_schema(std::shared_ptr<const Metadata> metadata) {
    TRACE_ON(METACONF_TRACE_CODEC) << "active schema: v" << (metadata ? int(metadata->version()) : 0)
                                   << TRACE_ENDL;
    active.emplace(*this, std::move(metadata));
    return *active;
}

const SchemaContext& TypeRegistry::active_schema() const {
    if (not active) {
        throw InternalError(F() << "No active schema was set in the type registry.");
    }
    return *active;
}
}  // namespace metaconf
