#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "metaconf/codec/schema_context.h"
#include "metaconf/codec/type_node.h"
#include "metaconf/meta/metadata.h"

#include <nlohmann/json.hpp>

namespace metaconf {
/*
 * Registry of the types known by name.
 *
 * Definitions are given in JSON, one entry per type name:
 *
 *   "Balance":     "u128"                             (alias)
 *   "AccountData": {"free": "Balance", ...}           (struct, fields in order)
 *   "Phase":       {"_enum": {"ApplyExtrinsic": "u32",
 *                             "Finalization": "Null"}} (enum)
 *   "Releases":    {"_enum": ["V1", "V2"]}             (enum without fields)
 *
 * A base set of definitions is registered on construction. Later
 * definitions override earlier ones with the same name.
 *
 * The registry also keeps the most recent active schema binding
 * (see set_active_schema). A registry is not meant to be shared between
 * fixtures: each one should use its own.
 * */
class TypeRegistry {
public:
    TypeRegistry();

    /*
     * Throw DecodeError if a definition is malformed (or the text
     * is not valid JSON). On error, none of the definitions of the call
     * are registered.
     * */
    void register_definitions(const nlohmann::ordered_json& defs);
    void register_definitions(const std::string& json_text);

    bool has_definition(const std::string& name) const;

    /*
     * Decode strategy of a named type. "Foo<u32>" is looked up
     * as is first and as "Foo" if there is no such definition.
     *
     * Throw DecodeError if the name is unknown.
     * */
    TypeNodePtr resolve_named(const std::string& name) const;

    /*
     * Bind the metadata as the active schema and return the context to
     * pass to the decode/encode operations.
     *
     * The binding replaces any previous one.
     * */
    SchemaContext set_active_schema(std::shared_ptr<const Metadata> metadata);

    /*
     * Context of the last set_active_schema call.
     * Throw InternalError if no schema was bound yet.
     * */
    const SchemaContext& active_schema() const;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

private:
    std::map<std::string, TypeNodePtr> definitions;
    std::optional<SchemaContext> active;
};

// JSON text of the definitions registered on construction
const char* base_type_definitions();
}  // namespace metaconf
