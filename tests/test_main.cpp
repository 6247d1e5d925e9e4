#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "ncaplay/log.hpp"

int main(int argc, char* argv[]) {
    // keep test output readable, warnings still show
    ncaplay::logger()->set_level(spdlog::level::warn);
    return Catch::Session().run(argc, argv);
}
