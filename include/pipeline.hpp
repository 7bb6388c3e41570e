#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "capture.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "dedup.hpp"
#include "events.hpp"
#include "frame_queue.hpp"
#include "inference.hpp"
#include "metrics.hpp"
#include "motion_gate.hpp"
#include "overlay.hpp"
#include "reconnect.hpp"
#include "sampling.hpp"
#include "storage.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

/**
 * @file pipeline.hpp
 * @brief Declares the supervisor that owns every stage and the process lifecycle.
 *
 * Acquisition runs on its own thread and only touches the frame queue. The
 * pipeline body (motion → sampling → inference → dedup → emit) runs as a
 * single sequential consumer on the thread calling run(), so events are
 * suppressed and emitted in the order their frames were popped.
 */

enum class PipelineState {
    Starting,
    Running,
    ReloadingConfig,
    Draining,
    Stopped
};

/**
 * @brief Why run() returned; mapped to a process exit code by main.
 */
enum class ExitReason {
    Clean,
    StorageFull,
    ReconnectFatal,
    InvalidConfig,
    HealthCheckFailed,
    DrainTimeout
};

const char* pipelineStateName(PipelineState state);
const char* exitReasonName(ExitReason reason);

/** @brief 0 success, 1 error, 2 invalid configuration, 3 storage full. */
int exitCodeFor(ExitReason reason);

/**
 * @brief External collaborators handed to the supervisor.
 *
 * Classifier and describer are shared: an abandoned call may still be
 * running inside them after shutdown and keeps its own reference.
 */
struct Collaborators {
    std::unique_ptr<IFrameSource> source;
    std::shared_ptr<IClassifier> classifier;
    std::shared_ptr<IDescriber> describer;
    std::vector<std::unique_ptr<IEventSink>> sinks;   //!< First entry is primary.
    std::unique_ptr<IMetricsSink> metrics_sink;       //!< Optional.
};

/**
 * @brief Orchestrates acquisition, the sequential pipeline body, and shutdown/reload.
 * @threading run() blocks the calling thread; requestShutdown()/requestReload()
 *            only store atomics and are safe from signal handlers.
 * @ownership Owns the queue, stages, sinks, metrics and acquisition thread.
 * @lifecycle start() → run() → destruction. Starting → Running ⇄ ReloadingConfig
 *            → Draining → Stopped. After a drain timeout run() returns while
 *            the acquisition thread may still be inside the source; the
 *            destructor blocks until it exits. Callers that cannot wait end
 *            the process instead of destroying the supervisor.
 */
class PipelineSupervisor {
public:
    PipelineSupervisor(const PipelineConfig& config, Collaborators collaborators,
                       IClock& clock = systemClock(), IConfigSource* config_source = nullptr);
    ~PipelineSupervisor();

    PipelineSupervisor(const PipelineSupervisor&) = delete;
    PipelineSupervisor& operator=(const PipelineSupervisor&) = delete;

    /**
     * @brief Health checks that must pass before any frame is consumed.
     *
     * The primary sink and the data directory are required and so is a
     * first successful source connection. Optional collaborators only warn.
     * @param error One-line reason on failure.
     */
    bool runHealthChecks(std::string& error);

    /**
     * @brief Run health checks and launch the acquisition thread.
     * @return False with @p error set when a required check fails.
     */
    bool start(std::string& error);

    /**
     * @brief Consume frames until shutdown, then drain and stop.
     * @return Reason for stopping; see diagnostic() for the one-line detail.
     */
    ExitReason run();

    /**
     * @brief Push one frame through motion, sampling, inference, dedup and emission.
     * @return True when an event was emitted for this frame.
     */
    bool processFrame(const Frame& frame);

    /** @brief Publish a metrics snapshot when the interval elapsed. */
    void tick();

    /** @brief Build, log and hand a snapshot to the metrics sink. */
    MetricsSnapshot publishMetrics();

    /** @brief Async-signal-safe shutdown request. */
    void requestShutdown() { shutdown_requested_.store(true); }
    /** @brief Async-signal-safe reload request, served between frames. */
    void requestReload() { reload_requested_.store(true); }

    /**
     * @brief Re-read the config source and apply it if valid.
     * @return False when loading or validation failed; the old config stays active.
     */
    bool reloadConfig();

    /**
     * @brief Validate and apply live tunables; restart-only fields are kept.
     */
    bool applyConfig(const PipelineConfig& next, std::string& error);

    PipelineState state() const { return state_.load(); }
    const std::string& diagnostic() const { return diagnostic_; }
    bool drainTimedOut() const { return drain_timed_out_; }
    const PipelineConfig& config() const { return config_; }

    MetricsAggregator& metrics() { return metrics_; }
    BoundedFrameQueue& queue() { return queue_; }
    Deduplicator& deduplicator() { return dedup_; }
    StorageGovernor& storage() { return storage_; }
    MotionGate& motionGate() { return motion_; }
    InferenceStage& inference() { return *inference_; }
    ReconnectSupervisor& reconnect() { return *reconnect_; }

private:
    /** @brief Acquisition thread body wrapping ReconnectSupervisor::run. */
    void acquisitionThread();
    /** @brief Stop admitting frames, flush sinks, final snapshot, join by deadline. */
    void drain();
    /** @brief True once shutdown was requested; arms the drain deadline on first call. */
    bool stopping();
    bool drainDeadlinePassed();
    bool emitEvent(const Frame& frame, const MotionResult& motion, const DetectionSet& dets,
                   double classification_ms, MonoTime started);
    void fail(ExitReason reason, const std::string& message);

    PipelineConfig config_;
    IClock& clock_;
    IConfigSource* config_source_;

    MetricsAggregator metrics_;
    ProcessMonitor process_;
    BoundedFrameQueue queue_;
    MotionGate motion_;
    SamplingPolicy sampler_;
    Deduplicator dedup_;
    StorageGovernor storage_;
    SnapshotWriter snapshots_;
    EventDispatcher dispatcher_;
    std::unique_ptr<IMetricsSink> metrics_sink_;
    std::unique_ptr<InferenceStage> inference_;
    std::unique_ptr<IFrameSource> source_;
    std::unique_ptr<ReconnectSupervisor> reconnect_;

    std::thread acquisition_thread_;
    std::atomic<bool> acquisition_stop_{false};
    std::atomic<bool> acquisition_done_{false};
    std::mutex acq_mu_;
    std::condition_variable acq_cv_;  //!< Signalled when the acquisition thread exits.

    std::atomic<PipelineState> state_{PipelineState::Starting};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> reload_requested_{false};
    std::atomic<bool> link_fatal_{false};
    bool drain_armed_ = false;
    MonoTime drain_deadline_;
    bool drain_timed_out_ = false;
    MonoTime next_metrics_;

    ExitReason exit_reason_ = ExitReason::Clean;
    std::string diagnostic_;
};

} // namespace vigil

#endif // PIPELINE_HPP
