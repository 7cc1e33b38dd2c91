#include "TickScheduler.h"

#include <algorithm>

namespace AntSim {

TickScheduler::TickScheduler(double tickSeconds)
    : tickSeconds_(std::max(MIN_TICK_SECONDS, tickSeconds))
{}

int TickScheduler::advance(double elapsedSeconds)
{
    if (elapsedSeconds > 0.0) {
        accumulator_ += elapsedSeconds;
    }

    int due = 0;
    while (accumulator_ >= tickSeconds_) {
        accumulator_ -= tickSeconds_;
        due++;
    }
    return due;
}

} // namespace AntSim
