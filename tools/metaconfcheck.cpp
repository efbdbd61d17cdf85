#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "metaconf/check/check.h"
#include "metaconf/check/config.h"
#include "metaconf/check/runner.h"
#include "metaconf/check/suite.h"
#include "metaconf/fixture/store.h"
#include "metaconf/log/trace.h"

using metaconf::Check;
using metaconf::CollectingRunner;
using metaconf::DefaultHarnessConfig;
using metaconf::FileFixtureStore;

std::string read_file(const char* fpath) {
    std::ifstream file(fpath);
    if (not file) {
        throw std::runtime_error(std::string("The file '") + fpath + "' could not be opened.");
    }

    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void print_usage() {
    std::cerr << "Missing/Bad arguments\n";
    std::cerr << "Usage:\n";
    std::cerr << "  check a blob:     metaconfcheck <version> <name> <blob.hex> [fixtures-root]\n";
    std::cerr << "\n";
    std::cerr << "The fixtures root defaults to $METACONF_FIXTURES_DIR or to '"
              << DefaultHarnessConfig.fixtures_root << "'.\n";
}

int main(int argc, char* argv[]) {
    int ret = -1;

    if (argc < 4 or argc > 5) {
        print_usage();
        return ret;
    }

    metaconf::log::set_trace_mask_from_env();

    char* end = nullptr;
    const unsigned long version = std::strtoul(argv[1], &end, 10);
    if (end == argv[1] or *end != '\0') {
        print_usage();
        return ret;
    }

    const char* root = DefaultHarnessConfig.fixtures_root;
    if (argc == 5) {
        root = argv[4];
    } else if (const char* env = std::getenv("METACONF_FIXTURES_DIR"); env and env[0] != '\0') {
        root = env;
    }

    std::vector<metaconf::named_check_t> checks;
    try {
        checks.push_back({argv[2], Check::from_hex(read_file(argv[3]))});
    } catch (const std::exception& err) {
        std::cerr << err.what() << "\n";
        return -2;
    }

    FileFixtureStore store(root);
    CollectingRunner runner;
    runner.echo_warnings = true;

    ret = 0;
    try {
        metaconf::test_meta(runner, store, unsigned(version), checks);
        runner.print_report(std::cout);
        if (runner.failed_count() > 0) {
            ret = -3;
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << "\n";
        ret = -4;
    }

    return ret;
}
