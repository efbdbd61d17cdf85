#pragma once

#include "metaconf/check/check.h"
#include "metaconf/check/runner.h"
#include "metaconf/codec/registry.h"

namespace metaconf {
/*
 * Round-Trip Verifier. Register the checks:
 *
 *  - "serializes to hex in the same form as retrieved": the decoded
 *    metadata re-encodes to exactly check.data. A decode failure is
 *    reported as a byte mismatch against an empty re-encoding.
 *
 *  - "can construct from asCallsOnly.toHex()": the calls-only projection
 *    re-encodes to bytes that decode without error.
 *
 *  - "can construct from a re-serialized form": skipped, implied by
 *    the first check.
 * */
void verify(CheckRunner& runner, TypeRegistry& registry, const Check& check);
}  // namespace metaconf
