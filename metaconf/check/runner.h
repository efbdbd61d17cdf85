#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "metaconf/err/msg.h"
#include "metaconf/mem/bytes.h"

namespace metaconf {
struct check_result_t {
    enum class Outcome {
        Passed,
        Failed,
        Skipped,
    };

    // Group the check belongs to (" > " separated if nested), empty if none
    std::string group;
    std::string name;
    Outcome outcome;

    // Why the check failed
    std::string message;
};

/*
 * Registration and reporting of the named checks.
 *
 * Each check is independent: a failure (an exception escaping its body)
 * fails only that check, its siblings still run.
 *
 * Subclasses decide how the results are reported but they must run
 * the body before register_check returns: the bodies reference state
 * owned by the caller.
 * */
class CheckRunner {
public:
    virtual void register_check(const std::string& name, const std::function<void()>& body) = 0;

    // A documented check that is reported but never executed
    virtual void register_skipped(const std::string& name) = 0;

    // Non-fatal diagnostic. By default it is written to stderr.
    virtual void warn(const std::string& msg);

    /*
     * Checks registered while a group is open belong to it.
     * Groups can be nested.
     * */
    void push_group(const std::string& name) { groups.push_back(name); }
    void pop_group();

    class GroupGuard {
    private:
        CheckRunner& runner;

    public:
        GroupGuard(CheckRunner& runner, const std::string& name): runner(runner) { runner.push_group(name); }
        ~GroupGuard() { runner.pop_group(); }

        GroupGuard(const GroupGuard&) = delete;
        GroupGuard& operator=(const GroupGuard&) = delete;
    };

    virtual ~CheckRunner() {}

protected:
    std::string current_group() const;

private:
    std::vector<std::string> groups;
};

/*
 * Run each check as soon as it is registered and collect the results.
 * */
class CollectingRunner: public CheckRunner {
public:
    CollectingRunner() = default;

    void register_check(const std::string& name, const std::function<void()>& body) override;
    void register_skipped(const std::string& name) override;
    void warn(const std::string& msg) override;

    const std::vector<check_result_t>& results() const { return checks; }
    const std::vector<std::string>& warnings() const { return warns; }

    // nullptr if there is no such check
    const check_result_t* find(const std::string& name) const;

    unsigned count(check_result_t::Outcome outcome) const;
    unsigned failed_count() const { return count(check_result_t::Outcome::Failed); }
    unsigned passed_count() const { return count(check_result_t::Outcome::Passed); }

    // If true, the warnings are also written to stderr (off by default)
    bool echo_warnings = false;

    /*
     * Pretty print the results, one line per check:
     *
     *   [PASS] serializes to hex in the same form as retrieved
     *   [FAIL] decodes latest substrate properly: <message>
     *   [SKIP] can construct from a re-serialized form
     * */
    void print_report(std::ostream& out) const;

private:
    std::vector<check_result_t> checks;
    std::vector<std::string> warns;
};

/*
 * Assertion helpers for the check bodies. They throw AssertionFailure.
 * */
[[noreturn]] void throw_assertion_failure(const F& msg);

void assert_equal(const bytes_t& actual, const bytes_t& expected, const std::string& note = "");

template <typename T>
void assert_equal(const T& actual, const T& expected, const std::string& what) {
    if (not(actual == expected)) {
        throw_assertion_failure(F() << what << ": expected " << expected << " but got " << actual << ".");
    }
}

// Run the function; any exception that escapes it becomes an AssertionFailure
void assert_no_throw(const std::function<void()>& fn);
}  // namespace metaconf
