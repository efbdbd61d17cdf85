#include "metaconf/check/conversion.h"

#include <memory>
#include <string>

#include "metaconf/log/trace.h"
#include "metaconf/meta/metadata.h"
#include "metaconf/meta/uniq_types.h"

namespace metaconf {
void check_conversion(CheckRunner& runner, TypeRegistry& registry, unsigned version, const Check& check,
                      bool strict) {
    runner.register_check("converts v" + std::to_string(version) + " to latest", [&]() {
        auto metadata = std::make_shared<const Metadata>(Metadata::decode(check.data));
        registry.set_active_schema(metadata);

        const auto& latest = metadata->as_latest();
        if (metadata->version() >= 14) {
            return;
        }

        const auto uniq = portable::get_uniq_types(latest, strict);
        for (const auto& collision: uniq.collisions) {
            runner.warn("Type " + collision.name + " is defined differently by lookup #" +
                        std::to_string(collision.first) + " and #" + std::to_string(collision.second));
        }

        TRACE_ON(METACONF_TRACE_CONVERT) << "v" << version << ": " << uniq.types.size() << " unique types, "
                                         << uniq.collisions.size() << " collisions" << TRACE_ENDL;
    });
}
}  // namespace metaconf
