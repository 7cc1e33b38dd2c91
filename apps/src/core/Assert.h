#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string_view>

namespace AntSim {

[[noreturn]] inline void assertionFailed(
    std::string_view condition, std::string_view message, const char* file, int line)
{
    spdlog::critical("Invariant violated at {}:{}: {}", file, line, message);
    spdlog::critical("  expected: {}", condition);
    spdlog::default_logger()->flush();
    std::abort();
}

} // namespace AntSim

/**
 * Always-on invariant check, kept in release builds.
 *
 * For programming errors only (a second queen in one generation, a genome of the
 * wrong length). Expected simulation outcomes such as deaths, blocked moves or
 * failed spawns are never asserted.
 */
#define ANTSIM_ASSERT(condition, message)                                          \
    do {                                                                           \
        if (!(condition)) {                                                        \
            ::AntSim::assertionFailed(#condition, message, __FILE__, __LINE__);    \
        }                                                                          \
    } while (0)
