#include "metaconf/check/runner.h"

#include <exception>
#include <iostream>
#include <utility>

#include "metaconf/err/exceptions.h"

namespace metaconf {
void CheckRunner::warn(const std::string& msg) { std::cerr << "WARN: " << msg << std::endl; }

void CheckRunner::pop_group() {
    if (groups.empty()) {
        throw InternalError(F() << "No check group to close.");
    }
    groups.pop_back();
}

std::string CheckRunner::current_group() const {
    std::string group;
    for (const auto& name: groups) {
        group += (group.empty() ? "" : " > ") + name;
    }
    return group;
}

void CollectingRunner::register_check(const std::string& name, const std::function<void()>& body) {
    check_result_t result{.group = current_group(), .name = name, .outcome = check_result_t::Outcome::Passed,
                          .message = ""};
    try {
        body();
    } catch (const std::exception& err) {
        result.outcome = check_result_t::Outcome::Failed;
        result.message = err.what();
    }
    checks.push_back(std::move(result));
}

void CollectingRunner::register_skipped(const std::string& name) {
    checks.push_back({.group = current_group(), .name = name, .outcome = check_result_t::Outcome::Skipped,
                      .message = ""});
}

void CollectingRunner::warn(const std::string& msg) {
    warns.push_back(msg);
    if (echo_warnings) {
        CheckRunner::warn(msg);
    }
}

const check_result_t* CollectingRunner::find(const std::string& name) const {
    for (const auto& result: checks) {
        if (result.name == name) {
            return &result;
        }
    }
    return nullptr;
}

unsigned CollectingRunner::count(check_result_t::Outcome outcome) const {
    unsigned cnt = 0;
    for (const auto& result: checks) {
        if (result.outcome == outcome) {
            ++cnt;
        }
    }
    return cnt;
}

void CollectingRunner::print_report(std::ostream& out) const {
    std::string group;
    for (const auto& result: checks) {
        if (result.group != group) {
            group = result.group;
            out << group << "\n";
        }

        out << (group.empty() ? "" : "  ");
        switch (result.outcome) {
            case check_result_t::Outcome::Passed:
                out << "[PASS] " << result.name;
                break;
            case check_result_t::Outcome::Failed:
                out << "[FAIL] " << result.name << ": " << result.message;
                break;
            case check_result_t::Outcome::Skipped:
                out << "[SKIP] " << result.name;
                break;
        }
        out << "\n";
    }

    out << passed_count() << " passed, " << failed_count() << " failed, "
        << count(check_result_t::Outcome::Skipped) << " skipped, " << warns.size() << " warnings" << std::endl;
}

void throw_assertion_failure(const F& msg) { throw AssertionFailure(msg); }

void assert_equal(const bytes_t& actual, const bytes_t& expected, const std::string& note) {
    if (actual == expected) {
        return;
    }

    F msg;
    msg << "Byte sequences differ (" << actual.size() << " vs " << expected.size()
        << " bytes expected): " << to_hex(actual) << " !== " << to_hex(expected);
    if (not note.empty()) {
        msg << " (" << note << ")";
    }
    throw AssertionFailure(msg);
}

void assert_no_throw(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const AssertionFailure&) {
        throw;
    } catch (const std::exception& err) {
        throw AssertionFailure(F() << "Expected no error but got: " << err.what());
    }
}
}  // namespace metaconf
