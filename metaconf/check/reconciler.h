#pragma once

#include <optional>
#include <string>

#include "metaconf/check/check.h"
#include "metaconf/check/config.h"
#include "metaconf/check/runner.h"
#include "metaconf/codec/registry.h"
#include "metaconf/fixture/store.h"

#include <nlohmann/json.hpp>

namespace metaconf {
/*
 * Golden-Fixture Reconciler. Register the checks:
 *
 *  - "decodes latest substrate properly": the metadata declares the given
 *    version and its structural tree, without metadata.v<version>.lookup,
 *    equals the stored (version, name, json) fixture.
 *
 *  - "decodes latest types correctly" (v14+ only): the lookup of the
 *    latest-version projection equals the stored (version, name, types)
 *    fixture.
 *
 * The decoded metadata is bound as the active schema of the registry.
 *
 * On a missing, unreadable or different fixture, Enforce mode throws FixtureMismatch
 * (failing the check) while Reconcile mode warns and writes the produced
 * tree to the store. If mode is not given, it is resolved from the
 * environment on each mismatch (see resolve_strict_mode).
 * */
void reconcile(CheckRunner& runner, TypeRegistry& registry, FixtureStore& store, const std::string& name,
               unsigned version, const Check& check, std::optional<StrictMode> mode = std::nullopt);

/*
 * Compare the produced tree against the stored fixture and apply
 * the mode on mismatch. Return true if the fixture matched.
 * */
bool compare_or_reconcile(CheckRunner& runner, FixtureStore& store, unsigned version, const std::string& name,
                          FixtureKind kind, const nlohmann::json& produced, std::optional<StrictMode> mode);

// The structural tree without the metadata.v<version>.lookup subtree
nlohmann::json strip_lookup(const nlohmann::json& tree, unsigned version);
}  // namespace metaconf
