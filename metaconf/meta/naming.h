#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "metaconf/meta/si.h"

namespace metaconf {
/*
 * Split the text in words (on '_', '-', spaces and on lower/upper case
 * boundaries) and join them back with the first word in lower case and
 * the rest capitalized.
 *
 *  "System"                -> "system"
 *  "ElectionsPhragmen"     -> "electionsPhragmen"
 *  "block_hash"            -> "blockHash"
 *  "UpgradedToU32RefCount" -> "upgradedToU32RefCount"
 * */
std::string string_camel_case(std::string_view text);

// Like string_camel_case but with the first word capitalized too
std::string string_pascal_case(std::string_view text);

// ASCII lower case
std::string string_lower_case(std::string_view text);
}  // namespace metaconf

namespace metaconf::portable {
/*
 * Human readable name of the type with the given id, as shown in the
 * location of a storage item:
 *
 *  - historic (legacy) types show their normalized type expression
 *  - primitives, sequences, arrays, tuples and compacts show their shape
 *    ("u32", "Vec<AccountId32>", "[u8;32]", "(u32,u64)", "Compact<u128>")
 *  - Option<T> shows its parameter
 *  - other composites and variants show their path in PascalCase
 *    without the "pallet" segment ("AccountInfo", "BalancesCall")
 *  - anything else is "Lookup<id>"
 * */
std::string lookup_type_name(const PortableRegistry& registry, LookupId id);

/*
 * Name under which the type is deduplicated when the registry is
 * flattened (the name that the uniqueness scan checks).
 *
 * Generic containers (Option, Result, Cow, BTreeMap, BTreeSet, Box,
 * Vec) and types without a path have no identity.
 * */
std::optional<std::string> lookup_type_identity(const PortableRegistry& registry, LookupId id);
}  // namespace metaconf::portable
