#pragma once

#include "metaconf/meta/legacy.h"
#include "metaconf/meta/portable.h"

namespace metaconf {
/*
 * Convert a legacy (v9 to v13) body to the latest (v15) shape.
 *
 * Each distinct legacy type expression, once normalized, is interned
 * into the lookup as a HistoricMetaCompat type. The calls, events and
 * errors of each module become Variant types with path
 * [<module>, "Call" | "Event" | "Error"] and the outer enums
 * (RuntimeCall, RuntimeEvent, RuntimeError) are built from them.
 *
 * Throw ConversionError if a type expression cannot be parsed or
 * the body cannot be represented in the latest shape.
 * */
portable::MetadataBody convert_to_latest(const legacy::MetadataBody& body);

/*
 * Convert a v14 body to v15. The lookup is kept as is; the outer enums
 * are taken from the lookup (types with path ending in RuntimeCall,
 * RuntimeEvent and RuntimeError) or built from the pallets if missing.
 * */
portable::MetadataBody convert_to_latest(const portable::MetadataBody& body);

/*
 * Reduced v15 body with the lookup, the extrinsic, the runtime type,
 * the outer enums and for each pallet only its name, index and calls.
 * */
portable::MetadataBody to_calls_only(const portable::MetadataBody& latest);
}  // namespace metaconf
