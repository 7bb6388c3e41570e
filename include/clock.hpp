#ifndef CLOCK_HPP
#define CLOCK_HPP

#include "types.hpp"
#include <chrono>

namespace vigil {

/**
 * @file clock.hpp
 * @brief Injectable time source for backoff, windows and metrics cadence.
 */

/**
 * @brief Abstract clock so time-dependent components can be driven by tests.
 * @threading Implementations must be safe to call from any thread.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /** @brief Monotonic time used for windows, deadlines and latency. */
    virtual MonoTime now() const = 0;

    /** @brief Wall-clock time used for event timestamps and partitions. */
    virtual WallTime wallNow() const = 0;

    /** @brief Block the caller for the given duration. */
    virtual void sleepFor(std::chrono::milliseconds d) = 0;
};

/**
 * @brief Clock backed by steady_clock/system_clock.
 */
class SystemClock : public IClock {
public:
    MonoTime now() const override;
    WallTime wallNow() const override;
    void sleepFor(std::chrono::milliseconds d) override;
};

/** @brief Process-wide system clock instance. */
IClock& systemClock();

/** @brief Milliseconds between two monotonic instants. */
inline double elapsedMs(MonoTime from, MonoTime to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace vigil

#endif // CLOCK_HPP
