#include "metaconf/check/reconciler.h"

#include <memory>
#include <utility>

#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"
#include "metaconf/meta/metadata.h"

namespace metaconf {
namespace {
// Path of the first difference between the trees, as a JSON pointer
std::string first_difference(const nlohmann::json& stored, const nlohmann::json& produced) {
    const auto patch = nlohmann::json::diff(stored, produced);
    if (patch.empty()) {
        return "";
    }
    const auto& op = patch[0];
    return op.value("op", "") + " at '" + op.value("path", "") + "'";
}
}  // namespace

nlohmann::json strip_lookup(const nlohmann::json& tree, unsigned version) {
    nlohmann::json stripped = tree;
    const std::string key = "v" + std::to_string(version);

    if (stripped.contains("metadata") and stripped["metadata"].contains(key) and
        stripped["metadata"][key].is_object()) {
        stripped["metadata"][key].erase("lookup");
    }
    return stripped;
}

bool compare_or_reconcile(CheckRunner& runner, FixtureStore& store, unsigned version, const std::string& name,
                          FixtureKind kind, const nlohmann::json& produced, std::optional<StrictMode> mode) {
    // An unreadable fixture is a mismatch like a missing one
    std::optional<nlohmann::json> stored;
    std::string unreadable;
    try {
        stored = store.read(version, name, kind);
    } catch (const FixtureStoreError& err) {
        unreadable = err.what();
    }

    if (stored and *stored == produced) {
        TRACE_ON(METACONF_TRACE_FIXTURE) << fixture_id(version, name, kind) << " matches" << TRACE_ENDL;
        return true;
    }

    const std::string id = fixture_id(version, name, kind);
    std::string what;
    if (stored) {
        what = "The produced tree differs from the stored one (first difference: " +
               first_difference(*stored, produced) + ").";
    } else if (not unreadable.empty()) {
        what = "The stored fixture could not be read. " + unreadable;
    } else {
        what = "There is no stored fixture at " + store.describe(version, name, kind) + ".";
    }

    const StrictMode effective = mode ? *mode : resolve_strict_mode();
    if (effective == StrictMode::Enforce) {
        throw FixtureMismatch(id, what);
    }

    runner.warn("Fixture " + id + " reconciled. " + what + " Writing " + store.describe(version, name, kind));
    store.write(version, name, kind, produced);
    return false;
}

void reconcile(CheckRunner& runner, TypeRegistry& registry, FixtureStore& store, const std::string& name,
               unsigned version, const Check& check, std::optional<StrictMode> mode) {
    runner.register_check("decodes latest substrate properly", [&]() {
        auto metadata = std::make_shared<const Metadata>(Metadata::decode(check.data));
        registry.set_active_schema(metadata);

        assert_equal(unsigned(metadata->version()), version, "metadata version");

        const auto tree = strip_lookup(metadata->to_json(), version);
        compare_or_reconcile(runner, store, version, name, FixtureKind::Json, tree, mode);
    });

    if (version >= 14) {
        runner.register_check("decodes latest types correctly", [&]() {
            auto metadata = std::make_shared<const Metadata>(Metadata::decode(check.data));
            registry.set_active_schema(metadata);

            const auto types = portable::to_json(metadata->as_latest().lookup);
            compare_or_reconcile(runner, store, version, name, FixtureKind::Types, types, mode);
        });
    }
}
}  // namespace metaconf
