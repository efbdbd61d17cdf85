#include "metaconf/check/reconciler.h"
#include "metaconf/check/runner.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/fixture/store.h"
#include "metaconf/meta/metadata.h"

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "test/testing_metaconf.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using ::testing::HasSubstr;
using ::testing::StartsWith;
using ::testing::AllOf;

using ::testing_metaconf::helpers::sample_check;

using namespace ::metaconf;

namespace {
    const char* const SUBSTRATE = "decodes latest substrate properly";
    const char* const TYPES = "decodes latest types correctly";

    TEST(ReconcilerTest, ReconcileThenEnforce) {
        MemFixtureStore store;
        const auto check = sample_check(9);

        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "relevant-chain", 9, check, StrictMode::Reconcile);

            // the missing fixture is written and the check passes
            EXPECT_EQ(runner.failed_count(), (unsigned)0);
            EXPECT_EQ(runner.passed_count(), (unsigned)1);
            EXPECT_EQ(runner.find(TYPES), nullptr);

            ASSERT_EQ(runner.warnings().size(), (size_t)1);
            EXPECT_THAT(runner.warnings()[0],
                        AllOf(StartsWith("Fixture v9/relevant-chain-json reconciled. "),
                              HasSubstr("There is no stored fixture at mem:v9/relevant-chain-json.")));

            EXPECT_EQ(store.write_count(), (unsigned)1);
            EXPECT_TRUE(registry.active_schema().has_metadata());
        }

        auto stored = store.read(9, "relevant-chain", FixtureKind::Json);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ((*stored)["magicNumber"], 1635018093);
        EXPECT_TRUE((*stored)["metadata"].contains("v9"));

        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "relevant-chain", 9, check, StrictMode::Enforce);

            EXPECT_EQ(runner.failed_count(), (unsigned)0);
            EXPECT_TRUE(runner.warnings().empty());
            EXPECT_EQ(store.write_count(), (unsigned)1);
        }
    }

    TEST(ReconcilerTest, EnforceMismatch) {
        MemFixtureStore store;
        const auto check = sample_check(11);

        auto tree = strip_lookup(Metadata::decode(check.data).to_json(), 11);
        tree["metadata"]["v11"]["modules"][0]["name"] = "NotSystem";
        store.write(11, "chain", FixtureKind::Json, tree);

        CollectingRunner runner;
        TypeRegistry registry;
        reconcile(runner, registry, store, "chain", 11, check, StrictMode::Enforce);

        const auto* result = runner.find(SUBSTRATE);
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result->outcome, check_result_t::Outcome::Failed);
        EXPECT_THAT(result->message, AllOf(StartsWith("Fixture v11/chain-json does not match. "),
                                           HasSubstr("first difference: replace at '/metadata/v11/modules/0/name'")));

        // enforce never writes
        EXPECT_EQ(store.write_count(), (unsigned)1);
        auto kept = store.read(11, "chain", FixtureKind::Json);
        ASSERT_TRUE(kept.has_value());
        EXPECT_EQ((*kept)["metadata"]["v11"]["modules"][0]["name"], "NotSystem");

        // missing fixture
        CollectingRunner runner2;
        reconcile(runner2, registry, store, "other", 11, check, StrictMode::Enforce);
        EXPECT_THAT(runner2.find(SUBSTRATE)->message, HasSubstr("There is no stored fixture at mem:v11/other-json."));
    }

    TEST(ReconcilerTest, PortableTypes) {
        MemFixtureStore store;

        CollectingRunner runner;
        TypeRegistry registry;
        reconcile(runner, registry, store, "chain", 14, sample_check(14), StrictMode::Reconcile);

        EXPECT_EQ(runner.passed_count(), (unsigned)2);
        ASSERT_NE(runner.find(TYPES), nullptr);
        EXPECT_EQ(store.size(), (size_t)2);

        // the json fixture has no lookup; the types fixture is the lookup
        // of the v15 projection (with the built RuntimeEvent and RuntimeError)
        auto json = store.read(14, "chain", FixtureKind::Json);
        ASSERT_TRUE(json.has_value());
        EXPECT_FALSE((*json)["metadata"]["v14"].contains("lookup"));
        EXPECT_TRUE((*json)["metadata"]["v14"].contains("pallets"));

        auto types = store.read(14, "chain", FixtureKind::Types);
        ASSERT_TRUE(types.has_value());
        EXPECT_EQ((*types)["types"].size(), (size_t)20);

        CollectingRunner runner2;
        reconcile(runner2, registry, store, "chain", 14, sample_check(14), StrictMode::Enforce);
        EXPECT_EQ(runner2.failed_count(), (unsigned)0);
    }

    TEST(ReconcilerTest, VersionMismatch) {
        MemFixtureStore store;
        CollectingRunner runner;
        TypeRegistry registry;

        reconcile(runner, registry, store, "chain", 10, sample_check(9), StrictMode::Reconcile);

        const auto* result = runner.find(SUBSTRATE);
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result->outcome, check_result_t::Outcome::Failed);
        EXPECT_THAT(result->message, HasSubstr("metadata version: expected 10 but got 9."));
        EXPECT_EQ(store.size(), (size_t)0);
    }

    TEST(ReconcilerTest, UnreadableFixture) {
        const auto root = std::filesystem::temp_directory_path() / "metaconf-test-unreadable-fixture";
        std::filesystem::remove_all(root);
        FileFixtureStore store(root.string());

        const auto fpath = store.describe(9, "relevant-chain", FixtureKind::Json);
        auto corrupt = [&]() {
            std::filesystem::create_directories(root / "v9");
            std::ofstream file(fpath);
            file << "{truncated";
        };
        const auto check = sample_check(9);

        // enforce fails and leaves the file as it is
        corrupt();
        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "relevant-chain", 9, check, StrictMode::Enforce);

            ASSERT_EQ(runner.failed_count(), (unsigned)1);
            EXPECT_THAT(runner.find(SUBSTRATE)->message,
                        AllOf(StartsWith("Fixture v9/relevant-chain-json does not match. "),
                              HasSubstr("The stored fixture could not be read. "),
                              HasSubstr("The file is not valid JSON.")));
        }

        // reconcile rewrites it
        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "relevant-chain", 9, check, StrictMode::Reconcile);

            EXPECT_EQ(runner.failed_count(), (unsigned)0);
            ASSERT_EQ(runner.warnings().size(), (size_t)1);
            EXPECT_THAT(runner.warnings()[0], HasSubstr("The stored fixture could not be read. "));

            auto stored = store.read(9, "relevant-chain", FixtureKind::Json);
            ASSERT_TRUE(stored.has_value());
            EXPECT_EQ((*stored)["magicNumber"], 1635018093);
        }

        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "relevant-chain", 9, check, StrictMode::Enforce);
            EXPECT_EQ(runner.failed_count(), (unsigned)0);
        }

        std::filesystem::remove_all(root);
    }

    TEST(ReconcilerTest, ModeFromEnvironment) {
        const char* prev = std::getenv("GITHUB_REPOSITORY");
        const std::optional<std::string> saved = prev ? std::optional<std::string>(prev) : std::nullopt;

        unsetenv("GITHUB_REPOSITORY");
        EXPECT_TRUE(resolve_strict_mode() == StrictMode::Reconcile);

        setenv("GITHUB_REPOSITORY", "", 1);
        EXPECT_TRUE(resolve_strict_mode() == StrictMode::Reconcile);

        setenv("GITHUB_REPOSITORY", "paritytech/chain", 1);
        EXPECT_TRUE(resolve_strict_mode() == StrictMode::Enforce);

        MemFixtureStore store;
        const auto check = sample_check(10);

        // in continuous integration a missing fixture fails
        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "chain", 10, check);

            ASSERT_EQ(runner.failed_count(), (unsigned)1);
            EXPECT_THAT(runner.find(SUBSTRATE)->message,
                        HasSubstr("There is no stored fixture at mem:v10/chain-json."));
            EXPECT_EQ(store.write_count(), (unsigned)0);
        }

        // elsewhere it is written
        unsetenv("GITHUB_REPOSITORY");
        {
            CollectingRunner runner;
            TypeRegistry registry;
            reconcile(runner, registry, store, "chain", 10, check);

            EXPECT_EQ(runner.failed_count(), (unsigned)0);
            EXPECT_EQ(runner.warnings().size(), (size_t)1);
            EXPECT_EQ(store.write_count(), (unsigned)1);
        }

        if (saved) {
            setenv("GITHUB_REPOSITORY", saved->c_str(), 1);
        }
    }

    TEST(ReconcilerTest, StripLookup) {
        auto tree = nlohmann::json::parse(R"({
            "magicNumber": 1635018093,
            "metadata": {"v14": {"lookup": {"types": []}, "pallets": []}}
        })");

        EXPECT_EQ(strip_lookup(tree, 14), nlohmann::json::parse(R"({
            "magicNumber": 1635018093,
            "metadata": {"v14": {"pallets": []}}
        })"));

        // other versions are left alone
        EXPECT_EQ(strip_lookup(tree, 15), tree);
    }
}
