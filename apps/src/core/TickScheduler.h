#pragma once

namespace AntSim {

/**
 * Fixed-timestep accumulator.
 *
 * An external clock feeds elapsed wall time through advance(); the return value
 * is how many whole ticks are now due. Remainders carry over, so no tick is ever
 * skipped, only deferred to the next advance().
 */
class TickScheduler {
public:
    static constexpr double MIN_TICK_SECONDS = 0.01;

    explicit TickScheduler(double tickSeconds);

    int advance(double elapsedSeconds);

    double getTickSeconds() const { return tickSeconds_; }
    double getAccumulated() const { return accumulator_; }
    void reset() { accumulator_ = 0.0; }

private:
    double tickSeconds_;
    double accumulator_ = 0.0;
};

} // namespace AntSim
