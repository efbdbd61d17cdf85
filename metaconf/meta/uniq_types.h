#pragma once

#include <map>
#include <string>
#include <vector>

#include "metaconf/meta/portable.h"

namespace metaconf::portable {
struct type_collision_t {
    std::string name;
    LookupId first;
    LookupId second;
};

struct uniq_types_t {
    // Identity name -> first type found with that name
    std::map<std::string, LookupId> types;

    // Other types with an already seen name but a different definition
    std::vector<type_collision_t> collisions;
};

/*
 * Walk every type reachable from the latest-version body (pallets,
 * extrinsic, runtime type, runtime apis and outer enums) and group them
 * by their deduplication identity (see lookup_type_identity).
 *
 * Two types with the same identity collide if their definitions
 * differ. If with_throw is true, the first collision throws
 * TypeCollision; otherwise the collisions are reported in the result.
 *
 * Throw ConversionError if a reachable id is missing in the lookup.
 * */
uniq_types_t get_uniq_types(const MetadataBody& latest, bool with_throw);
}  // namespace metaconf::portable
