#include "metaconf/check/config.h"
#include "metaconf/check/conversion.h"
#include "metaconf/check/runner.h"
#include "metaconf/check/suite.h"
#include "metaconf/fixture/store.h"
#include "metaconf/meta/metadata.h"

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "test/testing_metaconf.h"

#include <set>
#include <string>

using ::testing::HasSubstr;

using ::testing_metaconf::helpers::sample_check;
using ::testing_metaconf::helpers::sample_legacy_body;
using ::testing_metaconf::helpers::sample_portable_body;

using namespace ::metaconf;

namespace {
    constexpr static struct harness_config_t ReconcileConfig = {
            .fixtures_root = "fixtures",
            .defaults = {.strict = true, .verify_round_trip = true},
            .conversion = {.strict = true},
            .fixture_mode = StrictMode::Reconcile,
            .type_definitions = nullptr};

    constexpr static struct harness_config_t EnforceConfig = {
            .fixtures_root = "fixtures",
            .defaults = {.strict = true, .verify_round_trip = true},
            .conversion = {.strict = true},
            .fixture_mode = StrictMode::Enforce,
            .type_definitions = nullptr};

    TEST(SuiteTest, AllVersions) {
        MemFixtureStore store;

        for (unsigned version = 9; version <= 15; ++version) {
            CollectingRunner runner;
            test_meta(runner, store, version, {{"chain", sample_check(uint8_t(version))}}, ReconcileConfig);

            EXPECT_EQ(runner.failed_count(), (unsigned)0) << version;
            for (const auto& result: runner.results()) {
                EXPECT_EQ(result.message, "") << version << " " << result.name;
            }

            const std::string group = "v" + std::to_string(version) + "/chain";
            std::set<std::string> groups;
            for (const auto& result: runner.results()) {
                groups.insert(result.group);
            }
            EXPECT_EQ(groups, (std::set<std::string>{group, group + " > storage with default values"}));

            EXPECT_NE(runner.find("serializes to hex in the same form as retrieved"), nullptr);
            EXPECT_NE(runner.find("decodes latest substrate properly"), nullptr);
            EXPECT_NE(runner.find("converts v" + std::to_string(version) + " to latest"), nullptr);
            EXPECT_EQ(runner.find("decodes latest types correctly") != nullptr, version >= 14);
        }

        // the json fixtures of every version and the types fixtures of v14 and v15
        EXPECT_EQ(store.size(), (size_t)9);

        // a second run matches the fixtures written by the first one
        for (unsigned version = 9; version <= 15; ++version) {
            CollectingRunner runner;
            test_meta(runner, store, version, {{"chain", sample_check(uint8_t(version))}}, EnforceConfig);
            EXPECT_EQ(runner.failed_count(), (unsigned)0) << version;
            EXPECT_TRUE(runner.warnings().empty()) << version;
        }
        EXPECT_EQ(store.write_count(), (unsigned)9);
    }

    TEST(SuiteTest, SeveralFixtures) {
        MemFixtureStore store;
        CollectingRunner runner;

        auto broken = sample_check(12);
        broken.data.resize(20);

        test_meta(runner, store, 12, {{"good", sample_check(12)}, {"broken", broken}}, ReconcileConfig);

        // a broken fixture fails its own checks only
        unsigned good_failures = 0;
        unsigned broken_failures = 0;
        for (const auto& result: runner.results()) {
            if (result.outcome != check_result_t::Outcome::Failed) {
                continue;
            }
            if (result.group.starts_with("v12/good")) {
                ++good_failures;
            } else if (result.group.starts_with("v12/broken")) {
                ++broken_failures;
            }
        }
        EXPECT_EQ(good_failures, (unsigned)0);

        // round trip (2), substrate, conversion and the storage declarations
        EXPECT_EQ(broken_failures, (unsigned)5);
    }

    TEST(SuiteTest, CustomTypeDefinitions) {
        auto body = sample_legacy_body(11);
        body.modules[1].storage->items[1].type.value = "T::Mystery";
        const Check check{.data = Metadata(body).to_bytes(), .fails = {}};

        MemFixtureStore store;
        CollectingRunner runner;
        test_meta(runner, store, 11, {{"custom", check}}, ReconcileConfig);
        ASSERT_NE(runner.find("timestamp.didUpdate: Mystery"), nullptr);
        EXPECT_EQ(runner.find("timestamp.didUpdate: Mystery")->outcome, check_result_t::Outcome::Failed);

        constexpr static struct harness_config_t cfg = {
                .fixtures_root = "fixtures",
                .defaults = {.strict = true, .verify_round_trip = true},
                .conversion = {.strict = true},
                .fixture_mode = StrictMode::Reconcile,
                .type_definitions = R"({"Mystery": "bool"})"};

        CollectingRunner runner2;
        test_meta(runner2, store, 11, {{"custom", check}}, cfg);
        EXPECT_EQ(runner2.failed_count(), (unsigned)0);
    }

    TEST(SuiteTest, DanglingLookupId) {
        // System.Number declares a value type that is not in the lookup
        auto body = sample_portable_body(14);
        body.pallets[0].storage->items[1].value = 999;
        const Check dangling{.data = Metadata(body).to_bytes(), .fails = {}};

        MemFixtureStore store;
        CollectingRunner runner;
        test_meta(runner, store, 14, {{"dangling", dangling}, {"good", sample_check(14)}}, ReconcileConfig);

        const auto* result = runner.find("system.number: Lookup999");
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result->group, "v14/dangling > storage with default values");
        EXPECT_EQ(result->outcome, check_result_t::Outcome::Failed);
        EXPECT_THAT(result->message, HasSubstr("Lookup id 999 not found"));

        // the siblings of the item and the next fixture still run
        EXPECT_NE(runner.find("system.account: FrameSystemAccountInfo"), nullptr);

        unsigned good_results = 0;
        for (const auto& r: runner.results()) {
            if (r.group.starts_with("v14/good")) {
                ++good_results;
                EXPECT_NE(r.outcome, check_result_t::Outcome::Failed) << r.name;
            }
        }
        EXPECT_GT(good_results, (unsigned)0);
    }

    TEST(ConversionCheckTest, Collisions) {
        // two legacy modules whose calls end up with the same type name
        auto body = sample_legacy_body(12);
        body.modules[1].name = "System_";
        const Check check{.data = Metadata(body).to_bytes(), .fails = {}};

        CollectingRunner lenient;
        TypeRegistry registry;
        check_conversion(lenient, registry, 12, check, false);
        EXPECT_EQ(lenient.failed_count(), (unsigned)0);
        ASSERT_EQ(lenient.warnings().size(), (size_t)1);
        EXPECT_THAT(lenient.warnings()[0], HasSubstr("Type SystemCall is defined differently by lookup #"));

        CollectingRunner strict;
        check_conversion(strict, registry, 12, check, true);
        ASSERT_EQ(strict.failed_count(), (unsigned)1);
        EXPECT_THAT(strict.find("converts v12 to latest")->message,
                    HasSubstr("Type name 'SystemCall' is used by lookup #"));

        // the scan follows the version of the blob, not the claimed one
        CollectingRunner claimed;
        check_conversion(claimed, registry, 14, check, true);
        ASSERT_EQ(claimed.failed_count(), (unsigned)1);
        EXPECT_THAT(claimed.find("converts v14 to latest")->message, HasSubstr("SystemCall"));

        CollectingRunner portable;
        check_conversion(portable, registry, 12, sample_check(14), true);
        EXPECT_EQ(portable.failed_count(), (unsigned)0);
        EXPECT_TRUE(portable.warnings().empty());
    }

    TEST(ConfigTest, StrictMode) {
        EXPECT_STREQ(strict_mode_name(StrictMode::Enforce), "enforce");
        EXPECT_STREQ(strict_mode_name(StrictMode::Reconcile), "reconcile");

        EXPECT_FALSE(DefaultHarnessConfig.fixture_mode.has_value());
        EXPECT_TRUE(DefaultHarnessConfig.defaults.strict);
        EXPECT_TRUE(DefaultHarnessConfig.conversion.strict);
        EXPECT_STREQ(DefaultHarnessConfig.fixtures_root, "fixtures");
    }
}
