#include "metaconf/meta/storage.h"

#include "metaconf/meta/naming.h"

namespace metaconf::portable {
storage_value_t unwrap_storage_si(const StorageEntry& entry) {
    return {.type = entry.value, .is_optional = entry.modifier == StorageModifier::Optional};
}

std::string unwrap_storage_type(const PortableRegistry& registry, const StorageEntry& entry) {
    const auto val = unwrap_storage_si(entry);
    const auto name = lookup_type_name(registry, val.type);
    return val.is_optional ? "Option<" + name + ">" : name;
}
}  // namespace metaconf::portable
