#include "metaconf/fixture/store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "metaconf/err/exceptions.h"
#include "metaconf/log/trace.h"

namespace metaconf {
const char* fixture_kind_name(FixtureKind kind) {
    switch (kind) {
        case FixtureKind::Json:
            return "json";
        case FixtureKind::Types:
            return "types";
    }
    throw InternalError(F() << "Unknown fixture kind " << int(kind) << ".");
}

std::string fixture_id(unsigned version, const std::string& name, FixtureKind kind) {
    std::stringstream ss;
    ss << "v" << version << "/" << name << "-" << fixture_kind_name(kind);
    return ss.str();
}

FileFixtureStore::FileFixtureStore(const std::string& root): root(root) {}

std::string FileFixtureStore::describe(unsigned version, const std::string& name, FixtureKind kind) const {
    std::filesystem::path fpath(root);
    fpath /= "v" + std::to_string(version);
    fpath /= name + "-" + fixture_kind_name(kind) + ".json";
    return fpath.string();
}

std::optional<nlohmann::json> FileFixtureStore::read(unsigned version, const std::string& name, FixtureKind kind) {
    const auto fpath = describe(version, name, kind);

    std::error_code ec;
    if (not std::filesystem::exists(fpath, ec)) {
        TRACE_ON(METACONF_TRACE_FIXTURE) << "fixture " << fpath << " not found" << TRACE_ENDL;
        return std::nullopt;
    }

    std::ifstream file(fpath);
    if (not file) {
        throw FixtureStoreError(fpath, "The file exists but it could not be opened for reading.");
    }

    try {
        auto tree = nlohmann::json::parse(file);
        TRACE_ON(METACONF_TRACE_FIXTURE) << "fixture " << fpath << " read" << TRACE_ENDL;
        return tree;
    } catch (const nlohmann::json::parse_error& err) {
        throw FixtureStoreError(fpath, F() << "The file is not valid JSON. " << err.what());
    }
}

void FileFixtureStore::write(unsigned version, const std::string& name, FixtureKind kind,
                             const nlohmann::json& tree) {
    const auto fpath = describe(version, name, kind);

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(fpath).parent_path(), ec);
    if (ec) {
        throw FixtureStoreError(fpath, F() << "The folder could not be created: " << ec.message());
    }

    std::ofstream file(fpath, std::ios::out | std::ios::trunc);
    if (not file) {
        throw FixtureStoreError(fpath, "The file could not be opened for writing.");
    }

    file << tree.dump(2) << "\n";
    file.flush();
    if (not file) {
        throw FixtureStoreError(fpath, "The file could not be written.");
    }

    TRACE_ON(METACONF_TRACE_FIXTURE) << "fixture " << fpath << " written" << TRACE_ENDL;
}

std::optional<nlohmann::json> MemFixtureStore::read(unsigned version, const std::string& name, FixtureKind kind) {
    auto it = fixtures.find({version, name, kind});
    if (it == fixtures.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemFixtureStore::write(unsigned version, const std::string& name, FixtureKind kind,
                            const nlohmann::json& tree) {
    fixtures[{version, name, kind}] = tree;
    ++writes;
}

std::string MemFixtureStore::describe(unsigned version, const std::string& name, FixtureKind kind) const {
    return "mem:" + fixture_id(version, name, kind);
}
}  // namespace metaconf
