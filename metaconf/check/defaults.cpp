#include "metaconf/check/defaults.h"

#include <exception>
#include <memory>

#include "metaconf/codec/value_codec.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"
#include "metaconf/meta/metadata.h"
#include "metaconf/meta/naming.h"
#include "metaconf/meta/storage.h"

namespace metaconf {
namespace {
// A dangling lookup id leaves the type without a name: the item is
// still checked (and fails) under a "Lookup<id>" location
std::string item_location(const portable::PortableRegistry& lookup, const std::string& module,
                          const portable::StorageEntry& entry) {
    try {
        return storage_location(lookup, module, entry);
    } catch (const DecodeError& err) {
        TRACE_ON(METACONF_TRACE_DEFAULTS) << module << "." << entry.name << ": " << err.what() << TRACE_ENDL;
    }

    const auto val = portable::unwrap_storage_si(entry);
    const std::string name = "Lookup" + std::to_string(val.type);
    return string_camel_case(module) + "." + string_camel_case(entry.name) + ": " +
           (val.is_optional ? "Option<" + name + ">" : name);
}
}  // namespace

ValidationResult classify(const std::string& location, const storage_item_key_t& key, const std::string& error,
                          bool strict, const std::vector<Exemption>& fails) {
    if (not strict) {
        return ValidationResult::tolerated(error);
    }

    for (const auto& exemption: fails) {
        if (exemption.matches(location, key)) {
            return ValidationResult::tolerated(error);
        }
    }
    return ValidationResult::fatal(error);
}

std::string storage_location(const portable::PortableRegistry& lookup, const std::string& module,
                             const portable::StorageEntry& entry) {
    return string_camel_case(module) + "." + string_camel_case(entry.name) + ": " +
           portable::unwrap_storage_type(lookup, entry);
}

void check_fallback(const SchemaContext& ctx, const portable::StorageEntry& entry, bool verify_round_trip) {
    const auto val = portable::unwrap_storage_si(entry);
    const auto instance = decode_value(ctx, TypeNode::make_lookup(val.type), entry.fallback,
                                       decode_options_t{.is_optional = val.is_optional});

    if (not verify_round_trip) {
        return;
    }

    const auto actual = instance.to_bytes(true);
    if (actual != entry.fallback) {
        const int64_t delta = int64_t(entry.fallback.size()) - int64_t(actual.size());
        throw FidelityError(entry.fallback.size(), actual.size(),
                            F() << "Fallback does not match (" << delta << " bytes missing): " << to_hex(actual)
                                << " !== " << to_hex(entry.fallback));
    }
}

ValidationResult validate_item(const SchemaContext& ctx, const std::string& location,
                               const storage_item_key_t& key, const portable::StorageEntry& entry, bool strict,
                               bool verify_round_trip, const std::vector<Exemption>& fails) {
    try {
        check_fallback(ctx, entry, verify_round_trip);
    } catch (const DecodeError& err) {
        return classify(location, key, err.what(), strict, fails);
    } catch (const EncodeError& err) {
        return classify(location, key, err.what(), strict, fails);
    } catch (const FidelityError& err) {
        return classify(location, key, err.what(), strict, fails);
    }
    return ValidationResult::ok();
}

void validate_defaults(CheckRunner& runner, TypeRegistry& registry, const Check& check, bool strict,
                       bool verify_round_trip) {
    CheckRunner::GroupGuard group(runner, "storage with default values");

    std::shared_ptr<const Metadata> metadata;
    try {
        metadata = std::make_shared<const Metadata>(Metadata::decode(check.data));
        metadata->as_latest();
    } catch (const std::exception&) {
        // Without metadata there are no items: report the failure as a check
        auto err = std::current_exception();
        runner.register_check("decodes the storage declarations", [err]() { std::rethrow_exception(err); });
        return;
    }

    const SchemaContext ctx = registry.set_active_schema(metadata);
    const auto& latest = metadata->as_latest();

    for (const auto& pallet: latest.pallets) {
        if (not pallet.storage) {
            continue;
        }

        for (const auto& entry: pallet.storage->items) {
            const storage_item_key_t key{.module = pallet.name, .item = entry.name};
            const std::string location = item_location(latest.lookup, pallet.name, entry);

            runner.register_check(location, [&, ctx, key, location]() {
                assert_no_throw([&]() {
                    const auto result =
                            validate_item(ctx, location, key, entry, strict, verify_round_trip, check.fails);

                    TRACE_ON(METACONF_TRACE_DEFAULTS) << location << ": " << int(result.kind()) << TRACE_ENDL;
                    if (result.is_tolerated()) {
                        runner.warn(location + ":: " + result.reason());
                    } else if (result.is_fatal()) {
                        throw AssertionFailure(location + ":: " + result.reason());
                    }
                });
            });
        }
    }
}
}  // namespace metaconf
