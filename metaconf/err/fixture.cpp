#include "metaconf/err/fixture.h"

#include <sstream>
#include <string>

namespace metaconf {
FixtureMismatch::FixtureMismatch(const std::string& fixture_id, const std::string& msg) {
    std::stringstream ss;
    ss << "Fixture " << fixture_id << " does not match. " << msg;

    this->msg = ss.str();
}

FixtureMismatch::FixtureMismatch(const std::string& fixture_id, const F& msg):
        FixtureMismatch(fixture_id, msg.ss.str()) {}

const char* FixtureMismatch::what() const noexcept { return msg.data(); }

FixtureStoreError::FixtureStoreError(const std::string& fpath, const std::string& msg) {
    std::stringstream ss;
    ss << "Fixture file '" << fpath << "' failed.\n";
    ss << msg;

    this->msg = ss.str();
}

FixtureStoreError::FixtureStoreError(const std::string& fpath, const F& msg):
        FixtureStoreError(fpath, msg.ss.str()) {}

const char* FixtureStoreError::what() const noexcept { return msg.data(); }
}  // namespace metaconf
