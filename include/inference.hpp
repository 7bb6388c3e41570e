#ifndef INFERENCE_HPP
#define INFERENCE_HPP

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

class MetricsAggregator;

/**
 * @file inference.hpp
 * @brief Classification/description collaborator contracts and the timed stage around them.
 *
 * Recognition and text generation live outside this project. The pipeline
 * only depends on these interfaces and enforces its own per-call timeouts.
 */

/**
 * @brief Object recognition collaborator.
 * @threading Called from a single TimedInvoker worker thread.
 */
class IClassifier {
public:
    virtual ~IClassifier() = default;

    /**
     * @brief Detect objects in a BGR frame.
     * @return False on any collaborator error.
     */
    virtual bool classify(const Frame& frame, DetectionSet& out) = 0;

    /** @brief Reachability probe run before the first frame. */
    virtual bool healthCheck() = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Natural-language description collaborator.
 * @threading Called from a single TimedInvoker worker thread.
 */
class IDescriber {
public:
    virtual ~IDescriber() = default;

    virtual bool describe(const Frame& frame, const DetectionSet& detections, std::string& out) = 0;
    virtual bool healthCheck() = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Runs blocking collaborator calls on a dedicated worker with a caller-side deadline.
 *
 * At most one call is outstanding. A call that overruns its timeout is
 * abandoned: the caller returns TimedOut and the late result is discarded
 * when the worker finishes. While an abandoned call is still running, new
 * calls return Busy instead of queueing behind it.
 * @threading invoke() from one caller thread; the worker is internal.
 * @ownership Worker state is shared with the thread so an abandoned call
 *            may outlive this object.
 */
class TimedInvoker {
public:
    enum class Outcome {
        Ok,
        Failed,     //!< Job returned false or threw.
        TimedOut,   //!< Deadline passed before the job finished.
        Busy,       //!< A previous abandoned job is still running.
        Cancelled   //!< Abort predicate fired while waiting.
    };

    explicit TimedInvoker(std::string name);
    ~TimedInvoker();

    TimedInvoker(const TimedInvoker&) = delete;
    TimedInvoker& operator=(const TimedInvoker&) = delete;

    /**
     * @brief Run @p job on the worker and wait at most @p timeout.
     * @param abort Checked every @p poll; returning true ends the wait early.
     */
    Outcome invoke(std::function<bool()> job, std::chrono::milliseconds timeout,
                   const std::function<bool()>& abort = nullptr,
                   std::chrono::milliseconds poll = std::chrono::milliseconds(100));

    bool busy() const;

private:
    struct State;
    std::shared_ptr<State> state_;
    std::thread worker_;
    std::string name_;
};

const char* outcomeName(TimedInvoker::Outcome outcome);

/**
 * @brief Inference tunables mirrored from PipelineConfig.
 */
struct InferenceOptions {
    std::chrono::milliseconds classification_timeout{1000};
    std::chrono::milliseconds description_timeout{10000};
    std::vector<std::string> blacklist;
    double min_confidence = 0.5;
    std::chrono::milliseconds poll_interval{100};
};

/**
 * @brief Classification, filtering and description for sampled frames.
 *
 * Without a usable classifier the stage runs motion-only and reports one
 * full-frame "motion" detection per sampled frame. A failed or late
 * classification skips the frame. A failed or late description falls back to
 * "Detected: a, b".
 * @threading Pipeline consumer thread only.
 * @ownership Shares ownership of the collaborators with every queued call, so
 *            an abandoned call keeps its collaborator alive. Borrows metrics.
 */
class InferenceStage {
public:
    InferenceStage(std::shared_ptr<IClassifier> classifier, std::shared_ptr<IDescriber> describer,
                   InferenceOptions options, MetricsAggregator& metrics);

    /**
     * @brief Probe collaborators; unavailable ones are disabled with a warning.
     * @return Always true: both collaborators are optional.
     */
    bool healthCheck();

    /**
     * @brief Produce filtered detections for a sampled frame.
     * @param elapsed_ms Classification latency, 0 in motion-only mode.
     * @return False when the frame must be skipped.
     */
    bool detect(const Frame& frame, const MotionResult& motion, DetectionSet& out, double& elapsed_ms);

    /**
     * @brief Describe an event-worthy frame; never fails.
     * @param elapsed_ms Description latency, 0 when falling back without a call.
     */
    std::string describe(const Frame& frame, const DetectionSet& detections, double& elapsed_ms);

    /** @brief Drop blacklisted labels and detections below the confidence floor. */
    DetectionSet filter(const DetectionSet& detections) const;

    static std::string fallbackDescription(const DetectionSet& detections);
    static Detection motionDetection(const Frame& frame, const MotionResult& motion);

    /** @brief Predicate that cuts collaborator waits short, e.g. the drain deadline. */
    void setAbortPredicate(std::function<bool()> abort) { abort_ = std::move(abort); }

    void setOptions(const InferenceOptions& options) { options_ = options; }
    const InferenceOptions& options() const { return options_; }

    bool motionOnly() const { return !classifier_enabled_; }
    bool describerEnabled() const { return describer_enabled_; }

private:
    std::shared_ptr<IClassifier> classifier_;
    std::shared_ptr<IDescriber> describer_;
    bool classifier_enabled_;
    bool describer_enabled_;
    InferenceOptions options_;
    MetricsAggregator& metrics_;
    std::function<bool()> abort_;
    std::unique_ptr<TimedInvoker> classify_worker_;
    std::unique_ptr<TimedInvoker> describe_worker_;
};

} // namespace vigil

#endif // INFERENCE_HPP
