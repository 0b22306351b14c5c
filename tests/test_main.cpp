// tests/test_main.cpp
//
// IMPORTANT:
//   This must be the ONLY translation unit in the test executable that defines
//   DOCTEST_CONFIG_IMPLEMENT (or DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN).
//   All other test .cpp files should just include doctest WITHOUT those macros.
//
// We use DOCTEST_CONFIG_IMPLEMENT (instead of ...WITH_MAIN) so we can customize
// defaults and still support doctest command-line flags.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#undef DOCTEST_CONFIG_IMPLEMENT

#include "logging/Log.h"

#include <spdlog/spdlog.h>

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0".
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    // Worldgen logs are noise in test output; ORBIS_TEST_LOG=debug turns them back on.
    const char* level = std::getenv("ORBIS_TEST_LOG");
    orbis::logsys::LogOptions log;
    log.level = orbis::logsys::parse_level(level ? level : "off");
    orbis::logsys::init(log);

    doctest::Context context;

    // ----- sane defaults (can be overridden by CLI flags) -----
    context.setOption("order-by", "name");        // deterministic ordering
    context.setOption("duration", true);          // show timings (helps spot slow tests)

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    spdlog::shutdown();
    return res;
}
