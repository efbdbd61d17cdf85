#include "metaconf/check/suite.h"

#include <string>

#include "metaconf/check/conversion.h"
#include "metaconf/check/defaults.h"
#include "metaconf/check/reconciler.h"
#include "metaconf/check/round_trip.h"
#include "metaconf/codec/registry.h"

namespace metaconf {
void test_meta(CheckRunner& runner, FixtureStore& store, unsigned version, const std::vector<named_check_t>& checks,
               const struct harness_config_t& cfg) {
    for (const auto& [name, check]: checks) {
        CheckRunner::GroupGuard group(runner, "v" + std::to_string(version) + "/" + name);

        TypeRegistry registry;
        if (cfg.type_definitions) {
            registry.register_definitions(std::string(cfg.type_definitions));
        }

        verify(runner, registry, check);
        reconcile(runner, registry, store, name, version, check, cfg.fixture_mode);
        check_conversion(runner, registry, version, check, cfg.conversion.strict);
        validate_defaults(runner, registry, check, cfg.defaults.strict, cfg.defaults.verify_round_trip);
    }
}
}  // namespace metaconf
