#ifndef RECONNECT_HPP
#define RECONNECT_HPP

#include "capture.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "frame_queue.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace vigil {

class MetricsAggregator;

/**
 * @file reconnect.hpp
 * @brief Connection state machine with exponential backoff for the frame source.
 */

enum class LinkState {
    Disconnected,
    Connecting,
    Connected,
    Fatal
};

const char* linkStateName(LinkState state);

/**
 * @brief Backoff and failure limits, taken from PipelineConfig.
 */
struct ReconnectPolicy {
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{8000};
    int max_failures = 5;
    std::chrono::milliseconds read_timeout{5000};
    std::chrono::milliseconds poll_interval{100};
    FatalPolicy fatal_policy = FatalPolicy::Exit;

    static ReconnectPolicy fromConfig(const PipelineConfig& config);
};

/**
 * @brief Owns the Disconnected → Connecting → Connected cycle of one source.
 *
 * Every failed connect, stalled read or closed stream counts as one
 * consecutive failure and schedules a retry after 1s, 2s, 4s, 8s... capped at
 * the maximum. A successful connection resets the delay; a received frame
 * resets the failure count. Reaching the failure limit enters Fatal, which is
 * reported through the listener; the policy decides whether run() returns or
 * keeps retrying at the capped interval.
 *
 * @threading run() executes on the acquisition thread. State queries are safe
 *            from any thread. Transitions are serialized by an internal mutex
 *            and delivered to the listener in order, under that mutex.
 * @ownership Borrows the source, clock and metrics; all must outlive it.
 */
class ReconnectSupervisor {
public:
    using Listener = std::function<void(LinkState from, LinkState to, int failures)>;

    ReconnectSupervisor(IFrameSource& source, ReconnectPolicy policy, IClock& clock,
                        MetricsAggregator* metrics = nullptr);

    /** @brief Install transition observer; call before run(). */
    void setListener(Listener listener);

    /**
     * @brief Make one connection attempt.
     *
     * Only one attempt may be in progress; a concurrent caller gets false
     * without touching the source.
     * @return True when the source is connected afterwards.
     */
    bool reconnect();

    /**
     * @brief Record one failure, close the source and move to Disconnected or Fatal.
     */
    void reportFailure(const std::string& reason);

    /** @brief A frame arrived; clears the consecutive-failure count. */
    void reportFrame();

    /** @brief Delay before the next attempt given the current backoff step. */
    std::chrono::milliseconds currentBackoff() const;

    /** @brief Delay for the n-th consecutive failure (1-based). */
    static std::chrono::milliseconds backoffFor(int step, const ReconnectPolicy& policy);

    /**
     * @brief Acquisition loop: connect, read into the queue, back off on failure.
     *
     * Returns when @p stop is set or when Fatal is reached under
     * FatalPolicy::Exit. Every wait observes @p stop within one poll interval.
     */
    void run(BoundedFrameQueue& queue, const std::atomic<bool>& stop);

    LinkState state() const;
    int consecutiveFailures() const;
    bool isFatal() const { return state() == LinkState::Fatal; }

    void setPolicy(const ReconnectPolicy& policy);
    ReconnectPolicy policy() const;

private:
    void transitionLocked(LinkState to);
    bool sleepInterruptible(std::chrono::milliseconds d, const std::atomic<bool>& stop);

    IFrameSource& source_;
    IClock& clock_;
    MetricsAggregator* metrics_;
    Listener listener_;

    mutable std::mutex state_mu_;  //!< Guards state, counters, policy and listener delivery.
    std::mutex connect_mu_;        //!< Held for the duration of one connection attempt.
    ReconnectPolicy policy_;
    LinkState state_ = LinkState::Disconnected;
    int failures_ = 0;
    int backoff_step_ = 0;
};

} // namespace vigil

#endif // RECONNECT_HPP
