#pragma once

#include "metaconf/check/check.h"
#include "metaconf/check/runner.h"
#include "metaconf/codec/registry.h"

namespace metaconf {
/*
 * Version-Conversion Checker. Register the check "converts v<version> to latest":
 * the decoded metadata (bound as the active schema) converts to the latest
 * version without error.
 *
 * When the decoded metadata is of a version before 14 (whatever version
 * the caller claims), every type reachable from the latest projection
 * is also scanned for collisions (see portable::get_uniq_types). A collision
 * fails the check if strict is true, otherwise it is warned.
 * */
void check_conversion(CheckRunner& runner, TypeRegistry& registry, unsigned version, const Check& check,
                      bool strict);
}  // namespace metaconf
