#pragma once

#include <string>
#include <utility>
#include <vector>

#include "metaconf/check/check.h"
#include "metaconf/check/config.h"
#include "metaconf/check/runner.h"
#include "metaconf/fixture/store.h"

namespace metaconf {
typedef std::pair<std::string, Check> named_check_t;

/*
 * Run the whole harness for the fixtures of one schema version.
 *
 * For each named fixture, in order and under a group named after it,
 * a fresh TypeRegistry is created and the Round-Trip Verifier, the
 * Golden-Fixture Reconciler, the Version-Conversion Checker and the
 * Default-Value Validator run against it.
 * */
void test_meta(CheckRunner& runner, FixtureStore& store, unsigned version, const std::vector<named_check_t>& checks,
               const struct harness_config_t& cfg = DefaultHarnessConfig);
}  // namespace metaconf
