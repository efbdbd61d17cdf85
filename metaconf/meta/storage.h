#pragma once

#include <string>

#include "metaconf/meta/portable.h"
#include "metaconf/meta/si.h"

namespace metaconf::portable {
struct storage_value_t {
    // Type of the stored value (the inner type for Optional items)
    LookupId type;

    // The item has the Optional modifier: its fallback is an encoded Option<type>
    bool is_optional;
};

/*
 * Type actually stored by the item. For maps this is the type of the
 * values (not of the keys).
 * */
storage_value_t unwrap_storage_si(const StorageEntry& entry);

/*
 * Name of the type of the item as shown in its location: the name of
 * the stored type wrapped in "Option<...>" when the item is Optional.
 * */
std::string unwrap_storage_type(const PortableRegistry& registry, const StorageEntry& entry);
}  // namespace metaconf::portable
