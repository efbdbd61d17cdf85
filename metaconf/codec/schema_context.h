#pragma once

#include <memory>
#include <string>

#include "metaconf/codec/type_node.h"
#include "metaconf/meta/metadata.h"
#include "metaconf/meta/si.h"

namespace metaconf {
class TypeRegistry;

/*
 * The metadata that a decode operates against (the "active schema")
 * plus the registry of named types.
 *
 * A SchemaContext is returned by TypeRegistry::set_active_schema and
 * passed explicitly to every decode/encode; there is no process-wide
 * binding.
 *
 * The context does not own the registry: the registry must outlive
 * every context (and every Instance) made from it.
 * */
class SchemaContext {
public:
    SchemaContext(const TypeRegistry& registry, std::shared_ptr<const Metadata> metadata);

    /*
     * Decode strategy of the type with the given lookup id of the
     * latest-version projection of the bound metadata.
     *
     * The returned node is shallow: nested types are Lookup references
     * resolved by resolve().
     *
     * Throw DecodeError if the id is not in the lookup.
     * */
    TypeNodePtr resolve_type(portable::LookupId id) const;

    /*
     * Follow Lookup and Named references until a concrete node
     * is found. Any other node is returned as is.
     *
     * Throw DecodeError if a name cannot be resolved or the references
     * form a loop.
     * */
    TypeNodePtr resolve(const TypeNodePtr& node) const;

    // Human readable name of the type (see portable::lookup_type_name)
    std::string type_name(portable::LookupId id) const;

    bool has_metadata() const { return bool(meta); }

    // Throw InternalError if there is no metadata bound
    const Metadata& metadata() const;
    const portable::PortableRegistry& lookup() const;

    const TypeRegistry& registry() const { return *reg; }

private:
    const TypeRegistry* reg;
    std::shared_ptr<const Metadata> meta;
};
}  // namespace metaconf
