#pragma once

#include <optional>

namespace metaconf {
/*
 * What the Golden-Fixture Reconciler does when the produced tree
 * does not match the stored fixture (or there is none).
 * */
enum class StrictMode {
    Enforce,    // the mismatch fails the check
    Reconcile,  // the mismatch is logged and the fixture is (re)written
};

struct harness_config_t {
    /*
     * Folder of the golden fixtures, laid out as
     * <fixtures_root>/v<version>/<name>-<kind>.json
     * */
    const char* fixtures_root;

    /*
     * Configuration of the Default-Value Validator
     * */
    struct {
        // Failures of items not exempted by the check fail the item's check.
        // If false, all the failures are tolerated (warned).
        const bool strict;

        // Re-encode each decoded fallback and compare it with the original bytes
        const bool verify_round_trip;
    } defaults;

    struct {
        // A type collision found by the uniqueness scan fails the check.
        // If false (looser, for legacy fixtures) it is only warned.
        const bool strict;
    } conversion;

    /*
     * Mode of the Golden-Fixture Reconciler. If not set, it is
     * resolved on each mismatch from the environment (see resolve_strict_mode)
     * */
    const std::optional<StrictMode> fixture_mode;

    /*
     * Extra type definitions (JSON text, see TypeRegistry) registered
     * in each fresh registry; nullptr for none.
     * */
    const char* type_definitions;
};

constexpr static struct harness_config_t DefaultHarnessConfig = {
        .fixtures_root = "fixtures",
        .defaults = {.strict = true, .verify_round_trip = true},
        .conversion = {.strict = true},
        .fixture_mode = std::nullopt,
        .type_definitions = nullptr};

/*
 * Mode of the Golden-Fixture Reconciler when the caller did not pin one:
 * Enforce when running in continuous integration (GITHUB_REPOSITORY is set
 * and non-empty), Reconcile otherwise.
 * */
StrictMode resolve_strict_mode();

const char* strict_mode_name(StrictMode mode);
}  // namespace metaconf
