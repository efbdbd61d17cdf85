#pragma once

#include <string>
#include <vector>

#include "metaconf/check/check.h"
#include "metaconf/check/runner.h"
#include "metaconf/codec/registry.h"
#include "metaconf/codec/schema_context.h"
#include "metaconf/meta/portable.h"

namespace metaconf {
/*
 * Outcome of the validation of one storage item.
 * */
class ValidationResult {
public:
    enum class Kind {
        Ok,
        ToleratedFailure,  // warned, the check passes
        FatalFailure,      // the check fails
    };

    static ValidationResult ok() { return ValidationResult(Kind::Ok, ""); }
    static ValidationResult tolerated(const std::string& reason) {
        return ValidationResult(Kind::ToleratedFailure, reason);
    }
    static ValidationResult fatal(const std::string& reason) { return ValidationResult(Kind::FatalFailure, reason); }

    Kind kind() const { return k; }
    const std::string& reason() const { return why; }

    bool is_ok() const { return k == Kind::Ok; }
    bool is_tolerated() const { return k == Kind::ToleratedFailure; }
    bool is_fatal() const { return k == Kind::FatalFailure; }

private:
    ValidationResult(Kind k, const std::string& why): k(k), why(why) {}

    Kind k;
    std::string why;
};

/*
 * Classify a failure of the item at the given location: fatal if strict
 * and no exemption matches the item, tolerated otherwise.
 * */
ValidationResult classify(const std::string& location, const storage_item_key_t& key, const std::string& error,
                          bool strict, const std::vector<Exemption>& fails);

/*
 * Location of a storage item: "<lowerCamelModule>.<lowerCamelItem>: <type name>"
 * like "system.account: AccountInfo" or "timestamp.now: u64".
 * */
std::string storage_location(const portable::PortableRegistry& lookup, const std::string& module,
                             const portable::StorageEntry& entry);

/*
 * Decode the fallback of the item with its type (an Option of it for
 * Optional items) and, if verify_round_trip, check that the decoded value
 * re-encodes to exactly the same bytes.
 *
 * Throw DecodeError if the fallback cannot be decoded and FidelityError
 * if it does not re-encode to the same bytes.
 * */
void check_fallback(const SchemaContext& ctx, const portable::StorageEntry& entry, bool verify_round_trip);

/*
 * check_fallback() with its decode and fidelity errors classified.
 * */
ValidationResult validate_item(const SchemaContext& ctx, const std::string& location,
                               const storage_item_key_t& key, const portable::StorageEntry& entry, bool strict,
                               bool verify_round_trip, const std::vector<Exemption>& fails);

/*
 * Default-Value Validator. Register, under the group
 * "storage with default values", one check per storage item of every
 * module named by its location.
 *
 * Each check passes if the item validates or its failure is tolerated
 * (warned as "<location>:: <message>"), and fails with the failure
 * message otherwise.
 * */
void validate_defaults(CheckRunner& runner, TypeRegistry& registry, const Check& check, bool strict,
                       bool verify_round_trip);
}  // namespace metaconf
