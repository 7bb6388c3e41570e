#ifndef SAMPLING_HPP
#define SAMPLING_HPP

#include <cstdint>

namespace vigil {

/**
 * @file sampling.hpp
 * @brief Deterministic k-th frame sampling over motion-positive frames.
 */

/**
 * @brief Forwards every k-th motion-positive frame to inference.
 *
 * The counter only advances on frames that passed the motion gate, so for N
 * motion frames exactly floor(N / k) are forwarded.
 * @threading Pipeline consumer thread only.
 */
class SamplingPolicy {
public:
    explicit SamplingPolicy(int rate = 1) : rate_(rate < 1 ? 1 : rate) {}

    /** @brief Pure predicate over a 1-based motion frame count. */
    bool shouldSample(uint64_t motion_count) const {
        return motion_count % static_cast<uint64_t>(rate_) == 0;
    }

    /** @brief Count one motion frame and report whether to forward it. */
    bool admit() { return shouldSample(++motion_count_); }

    void setRate(int rate) { rate_ = rate < 1 ? 1 : rate; }
    int rate() const { return rate_; }
    uint64_t motionCount() const { return motion_count_; }

private:
    int rate_;
    uint64_t motion_count_ = 0;
};

} // namespace vigil

#endif // SAMPLING_HPP
