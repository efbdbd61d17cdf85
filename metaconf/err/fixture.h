#pragma once

#include <stdexcept>
#include <string>

#include "metaconf/err/msg.h"

namespace metaconf {
// The structural tree differs from the stored golden fixture (or there is none).
class FixtureMismatch: public std::exception {
private:
    std::string msg;

public:
    FixtureMismatch(const std::string& fixture_id, const std::string& msg);
    FixtureMismatch(const std::string& fixture_id, const F& msg);

    const char* what() const noexcept override;
};

// The fixture store could not read or write a fixture.
class FixtureStoreError: public std::exception {
private:
    std::string msg;

public:
    FixtureStoreError(const std::string& fpath, const std::string& msg);
    FixtureStoreError(const std::string& fpath, const F& msg);

    const char* what() const noexcept override;
};
}  // namespace metaconf
