#include "metaconf/check/round_trip.h"
#include "metaconf/check/runner.h"
#include "metaconf/err/exceptions.h"

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "test/testing_metaconf.h"

#include <sstream>

using ::testing::HasSubstr;
using ::testing::ThrowsMessage;
using ::testing::StartsWith;

using ::testing_metaconf::helpers::sample_check;
using ::testing_metaconf::helpers::subvec;

using namespace ::metaconf;

namespace {
    TEST(RoundTripTest, AllVersionsPass) {
        for (uint8_t version = 9; version <= 15; ++version) {
            CollectingRunner runner;
            TypeRegistry registry;

            verify(runner, registry, sample_check(version));

            EXPECT_EQ(runner.results().size(), (size_t)3);
            EXPECT_EQ(runner.passed_count(), (unsigned)2) << int(version);
            EXPECT_EQ(runner.failed_count(), (unsigned)0) << int(version);
            EXPECT_EQ(runner.count(check_result_t::Outcome::Skipped), (unsigned)1);

            // the decoded metadata is left bound as the active schema
            EXPECT_TRUE(registry.active_schema().has_metadata());
        }
    }

    TEST(RoundTripTest, TruncatedData) {
        CollectingRunner runner;
        TypeRegistry registry;

        auto check = sample_check(12);
        check.data = subvec(check.data, 0, -3);
        verify(runner, registry, check);

        const auto* serializes = runner.find("serializes to hex in the same form as retrieved");
        ASSERT_NE(serializes, nullptr);
        EXPECT_EQ(serializes->outcome, check_result_t::Outcome::Failed);
        EXPECT_THAT(serializes->message, StartsWith("Byte sequences differ (0 vs "));
        EXPECT_THAT(serializes->message, HasSubstr("Decode failed at byte "));

        const auto* calls_only = runner.find("can construct from asCallsOnly.toHex()");
        ASSERT_NE(calls_only, nullptr);
        EXPECT_EQ(calls_only->outcome, check_result_t::Outcome::Failed);

        EXPECT_EQ(runner.failed_count(), (unsigned)2);
    }

    TEST(CheckRunnerTest, GroupsAndReport) {
        CollectingRunner runner;
        {
            CheckRunner::GroupGuard outer(runner, "v9/chain");
            runner.register_check("passes", []() {});
            {
                CheckRunner::GroupGuard inner(runner, "storage with default values");
                runner.register_check("fails", []() { throw AssertionFailure("nope"); });
            }
            runner.register_skipped("later");
        }
        runner.register_check("top level", []() {});
        runner.warn("careful");

        ASSERT_EQ(runner.results().size(), (size_t)4);
        EXPECT_EQ(runner.results()[0].group, "v9/chain");
        EXPECT_EQ(runner.results()[1].group, "v9/chain > storage with default values");
        EXPECT_EQ(runner.results()[1].message, "nope");
        EXPECT_EQ(runner.results()[2].group, "v9/chain");
        EXPECT_EQ(runner.results()[3].group, "");
        EXPECT_EQ(runner.warnings(), (std::vector<std::string>{"careful"}));
        EXPECT_EQ(runner.find("missing"), nullptr);

        std::stringstream ss;
        runner.print_report(ss);
        EXPECT_EQ(ss.str(),
                  "v9/chain\n"
                  "  [PASS] passes\n"
                  "v9/chain > storage with default values\n"
                  "  [FAIL] fails: nope\n"
                  "v9/chain\n"
                  "  [SKIP] later\n"
                  "\n"
                  "[PASS] top level\n"
                  "2 passed, 1 failed, 1 skipped, 1 warnings\n");

        EXPECT_THAT(
            [&]() { runner.pop_group(); },
            ThrowsMessage<InternalError>(HasSubstr("No check group to close."))
        );
    }

    TEST(CheckRunnerTest, Asserts) {
        EXPECT_THAT(
            []() { assert_equal(bytes_t{0x01, 0x02}, bytes_t{0x01, 0x02, 0x03}, "short"); },
            ThrowsMessage<AssertionFailure>(
                HasSubstr("Byte sequences differ (2 vs 3 bytes expected): 0x0102 !== 0x010203 (short)"))
        );

        EXPECT_THAT(
            []() { assert_equal(9u, 10u, "metadata version"); },
            ThrowsMessage<AssertionFailure>(HasSubstr("metadata version: expected 10 but got 9."))
        );

        EXPECT_THAT(
            []() { assert_no_throw([]() { throw DecodeError("boom"); }); },
            ThrowsMessage<AssertionFailure>(HasSubstr("Expected no error but got: boom"))
        );

        // assertion failures go through unchanged
        EXPECT_THAT(
            []() { assert_no_throw([]() { throw AssertionFailure("as is"); }); },
            ThrowsMessage<AssertionFailure>(::testing::StrEq("as is"))
        );

        assert_equal(bytes_t{0xaa}, bytes_t{0xaa});
        assert_no_throw([]() {});
    }
}
