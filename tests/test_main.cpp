#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/Logger.hpp"

int main(int argc, char** argv) {
    // Flows log every step; keep the runner output readable
    vitco::logging::setLevel(vitco::LogLevel::Error);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
