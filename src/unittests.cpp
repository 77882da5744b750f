#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

// Runs all lsra unittests. Pipeline stages log their progress at debug level, which helps when reading failures.
int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%l] %v");
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
