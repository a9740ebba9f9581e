#pragma once

/// @file test_main.hpp
/// @brief doctest entry point for suites whose code under test logs.
///
/// Include once, from the suite's only translation unit, instead of defining
/// DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN. Logging goes to cadence_tests.log so
/// the CDN_ macros have live loggers behind them.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"

int main(int argc, char** argv)
{
    cadence::core::Logger::init({.file_path = "cadence_tests.log", .level = spdlog::level::trace});

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    const int result = context.run();

    cadence::core::Logger::shutdown();
    return result;
}
