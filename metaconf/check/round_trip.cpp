#include "metaconf/check/round_trip.h"

#include <memory>
#include <string>

#include "metaconf/err/exceptions.h"
#include "metaconf/meta/metadata.h"

namespace metaconf {
void verify(CheckRunner& runner, TypeRegistry& registry, const Check& check) {
    runner.register_check("serializes to hex in the same form as retrieved", [&]() {
        bytes_t reencoded;
        std::string note;
        try {
            auto metadata = std::make_shared<const Metadata>(Metadata::decode(check.data));
            registry.set_active_schema(metadata);
            reencoded = metadata->to_bytes();
        } catch (const DecodeError& err) {
            note = err.what();
        }

        assert_equal(reencoded, check.data, note);
    });

    runner.register_check("can construct from asCallsOnly.toHex()", [&]() {
        const auto metadata = Metadata::decode(check.data);
        const auto calls_only = metadata.as_calls_only();
        assert_no_throw([&]() { Metadata::from_hex(calls_only.to_hex()); });
    });

    runner.register_skipped("can construct from a re-serialized form");
}
}  // namespace metaconf
