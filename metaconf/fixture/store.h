#pragma once

#include <map>
#include <optional>
#include <string>
#include <tuple>

#include <nlohmann/json.hpp>

namespace metaconf {
enum class FixtureKind {
    Json,   // structural tree of the metadata (without its lookup)
    Types,  // lookup of the latest-version projection (v14+)
};

// "json" or "types"
const char* fixture_kind_name(FixtureKind kind);

// Human readable id of a fixture: "v<version>/<name>-<kind>"
std::string fixture_id(unsigned version, const std::string& name, FixtureKind kind);

/*
 * Key-value store of golden fixtures, keyed by (version, name, kind).
 * */
class FixtureStore {
public:
    // std::nullopt if there is no such fixture
    virtual std::optional<nlohmann::json> read(unsigned version, const std::string& name, FixtureKind kind) = 0;

    virtual void write(unsigned version, const std::string& name, FixtureKind kind, const nlohmann::json& tree) = 0;

    // Where the fixture is (or would be) stored
    virtual std::string describe(unsigned version, const std::string& name, FixtureKind kind) const = 0;

    virtual ~FixtureStore() {}
};

/*
 * Fixtures stored as files <root>/v<version>/<name>-<kind>.json,
 * in JSON indented by 2 spaces.
 *
 * read() and write() throw FixtureStoreError if the file exists but
 * cannot be read/parsed or if it cannot be written.
 * */
class FileFixtureStore: public FixtureStore {
public:
    explicit FileFixtureStore(const std::string& root);

    std::optional<nlohmann::json> read(unsigned version, const std::string& name, FixtureKind kind) override;
    void write(unsigned version, const std::string& name, FixtureKind kind, const nlohmann::json& tree) override;
    std::string describe(unsigned version, const std::string& name, FixtureKind kind) const override;

private:
    const std::string root;
};

/*
 * Fixtures kept in memory, for tests and dry runs.
 * */
class MemFixtureStore: public FixtureStore {
public:
    MemFixtureStore() = default;

    std::optional<nlohmann::json> read(unsigned version, const std::string& name, FixtureKind kind) override;
    void write(unsigned version, const std::string& name, FixtureKind kind, const nlohmann::json& tree) override;
    std::string describe(unsigned version, const std::string& name, FixtureKind kind) const override;

    size_t size() const { return fixtures.size(); }
    unsigned write_count() const { return writes; }

private:
    std::map<std::tuple<unsigned, std::string, FixtureKind>, nlohmann::json> fixtures;
    unsigned writes = 0;
};
}  // namespace metaconf
