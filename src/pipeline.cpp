#include "pipeline.hpp"
#include "format.hpp"
#include "log.hpp"
#include <filesystem>
#include <sstream>

/**
 * @file pipeline.cpp
 * @brief Supervisor lifecycle, the sequential frame path and config reload.
 */

namespace vigil {

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Starting: return "Starting";
        case PipelineState::Running: return "Running";
        case PipelineState::ReloadingConfig: return "ReloadingConfig";
        case PipelineState::Draining: return "Draining";
        case PipelineState::Stopped: return "Stopped";
    }
    return "Stopped";
}

const char* exitReasonName(ExitReason reason) {
    switch (reason) {
        case ExitReason::Clean: return "clean";
        case ExitReason::StorageFull: return "storage full";
        case ExitReason::ReconnectFatal: return "reconnect fatal";
        case ExitReason::InvalidConfig: return "invalid config";
        case ExitReason::HealthCheckFailed: return "health check failed";
        case ExitReason::DrainTimeout: return "drain timeout";
    }
    return "clean";
}

int exitCodeFor(ExitReason reason) {
    switch (reason) {
        case ExitReason::Clean: return 0;
        case ExitReason::InvalidConfig: return 2;
        case ExitReason::StorageFull: return 3;
        case ExitReason::ReconnectFatal:
        case ExitReason::HealthCheckFailed:
        case ExitReason::DrainTimeout:
            return 1;
    }
    return 1;
}

static InferenceOptions inference_options(const PipelineConfig& c) {
    InferenceOptions o;
    o.classification_timeout = std::chrono::milliseconds(c.classification_timeout_ms);
    o.description_timeout = std::chrono::milliseconds(c.description_timeout_ms);
    o.blacklist = c.blacklist_objects;
    o.min_confidence = c.min_object_confidence;
    o.poll_interval = std::chrono::milliseconds(c.poll_interval_ms);
    return o;
}

PipelineSupervisor::PipelineSupervisor(const PipelineConfig& config, Collaborators collaborators,
                                       IClock& clock, IConfigSource* config_source)
    : config_(config),
      clock_(clock),
      config_source_(config_source),
      queue_(static_cast<size_t>(config.queue_capacity)),
      motion_(config.motion_threshold),
      sampler_(config.sampling_rate),
      dedup_(std::chrono::seconds(config.suppression_window_s), config.dedup_overlap,
             config.refresh_on_suppress),
      storage_(config.data_dir, config.maxStorageBytes(), config.min_retention_days,
               config.storage_check_interval, clock),
      snapshots_(config.data_dir),
      dispatcher_(&metrics_),
      metrics_sink_(std::move(collaborators.metrics_sink)),
      source_(std::move(collaborators.source)) {
    LogLevel level;
    if (parseLogLevel(config_.log_level, level)) setLogLevel(level);

    queue_.setDropHook([this](size_t n) { metrics_.framesDropped(n); });
    for (auto& sink : collaborators.sinks) dispatcher_.addSink(std::move(sink));

    inference_ = std::make_unique<InferenceStage>(collaborators.classifier, collaborators.describer,
                                                  inference_options(config_), metrics_);
    inference_->setAbortPredicate([this]() { return drainDeadlinePassed(); });

    if (source_) {
        source_->setInterrupt(&acquisition_stop_);
        reconnect_ = std::make_unique<ReconnectSupervisor>(*source_, ReconnectPolicy::fromConfig(config_),
                                                           clock_, &metrics_);
        reconnect_->setListener([this](LinkState, LinkState to, int) {
            if (to == LinkState::Fatal) link_fatal_.store(true);
        });
    }
}

PipelineSupervisor::~PipelineSupervisor() {
    requestShutdown();
    acquisition_stop_.store(true);
    queue_.stop();
    if (acquisition_thread_.joinable()) {
        if (drain_timed_out_) {
            VIGIL_LOG_WARN("pipeline") << "waiting for stuck acquisition thread before teardown";
        }
        acquisition_thread_.join();
    }
}

void PipelineSupervisor::fail(ExitReason reason, const std::string& message) {
    if (exit_reason_ == ExitReason::Clean) {
        exit_reason_ = reason;
        diagnostic_ = message;
    }
    requestShutdown();
}

bool PipelineSupervisor::runHealthChecks(std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) {
        error = "data directory " + config_.data_dir + " unusable: " + ec.message();
        return false;
    }
    if (!dispatcher_.openAll(error)) return false;

    inference_->healthCheck();

    if (!source_ || !reconnect_) {
        error = "no frame source configured";
        return false;
    }
    if (!reconnect_->reconnect()) {
        error = "cannot connect to " + source_->describe();
        return false;
    }
    VIGIL_LOG_INFO("pipeline") << "health checks passed (motion-only="
                               << (inference_->motionOnly() ? "yes" : "no") << ", sinks="
                               << dispatcher_.sinkCount() << ")";
    return true;
}

bool PipelineSupervisor::start(std::string& error) {
    state_.store(PipelineState::Starting);
    if (!runHealthChecks(error)) {
        fail(ExitReason::HealthCheckFailed, "health check failed: " + error);
        state_.store(PipelineState::Stopped);
        return false;
    }
    acquisition_stop_.store(false);
    acquisition_done_.store(false);
    acquisition_thread_ = std::thread(&PipelineSupervisor::acquisitionThread, this);
    next_metrics_ = clock_.now() + std::chrono::seconds(config_.metrics_interval_s);
    state_.store(PipelineState::Running);
    VIGIL_LOG_INFO("pipeline") << "running camera=" << config_.camera_id << " queue=" << queue_.capacity()
                               << " sampling=1/" << sampler_.rate() << " window="
                               << config_.suppression_window_s << "s";
    return true;
}

void PipelineSupervisor::acquisitionThread() {
    try {
        reconnect_->run(queue_, acquisition_stop_);
    } catch (const std::exception& ex) {
        VIGIL_LOG_ERROR("pipeline") << "acquisition thread exception: " << ex.what();
    }
    {
        std::lock_guard<std::mutex> lk(acq_mu_);
        acquisition_done_.store(true);
    }
    acq_cv_.notify_all();
}

bool PipelineSupervisor::stopping() {
    if (!shutdown_requested_.load()) return false;
    if (!drain_armed_) {
        drain_armed_ = true;
        drain_deadline_ = clock_.now() + std::chrono::milliseconds(config_.drain_timeout_ms);
    }
    return true;
}

bool PipelineSupervisor::drainDeadlinePassed() {
    return stopping() && clock_.now() >= drain_deadline_;
}

ExitReason PipelineSupervisor::run() {
    if (state_.load() != PipelineState::Running) return exit_reason_;
    const auto poll = std::chrono::milliseconds(config_.poll_interval_ms);

    while (!stopping()) {
        if (reload_requested_.exchange(false)) reloadConfig();

        if (link_fatal_.exchange(false)) {
            if (reconnect_->policy().fatal_policy == FatalPolicy::Exit) {
                std::ostringstream oss;
                oss << "camera unreachable: " << reconnect_->consecutiveFailures()
                    << " consecutive reconnect failures for " << source_->describe();
                fail(ExitReason::ReconnectFatal, oss.str());
                break;
            }
            VIGIL_LOG_ERROR("pipeline") << "reconnect limit reached; retrying at capped interval";
        }

        Frame frame;
        if (queue_.pop(frame, poll)) {
            try {
                processFrame(frame);
            } catch (const std::exception& ex) {
                metrics_.frameError();
                VIGIL_LOG_ERROR("pipeline") << "frame " << frame.frame_id << " failed: " << ex.what();
            }
        }
        try {
            tick();
        } catch (const std::exception& ex) {
            VIGIL_LOG_ERROR("pipeline") << "metrics tick failed: " << ex.what();
        }
    }

    drain();
    return exit_reason_;
}

bool PipelineSupervisor::processFrame(const Frame& frame) {
    const MonoTime started = clock_.now();
    metrics_.frameSeen();

    MotionResult motion;
    try {
        motion = motion_.evaluate(frame);
    } catch (const std::exception& ex) {
        metrics_.frameError();
        VIGIL_LOG_WARN("pipeline") << "frame " << frame.frame_id << ": motion stage failed: " << ex.what();
        return false;
    }
    metrics_.recordMotion(elapsedMs(started, clock_.now()));
    if (!motion.has_motion) return false;
    metrics_.motionFrame();
    VIGIL_LOG_DEBUG("pipeline") << "frame " << frame.frame_id << ": motion " << motion.confidence;

    if (!sampler_.admit()) return false;
    metrics_.frameSampled();
    if (stopping()) return false;

    DetectionSet dets;
    double classification_ms = 0.0;
    if (!inference_->detect(frame, motion, dets, classification_ms)) {
        metrics_.frameError();
        return false;
    }
    if (dets.empty()) return false;
    if (stopping()) return false;

    if (!dedup_.shouldEmit(dets, clock_.now())) {
        metrics_.eventSuppressed();
        return false;
    }
    return emitEvent(frame, motion, dets, classification_ms, started);
}

bool PipelineSupervisor::emitEvent(const Frame& frame, const MotionResult& motion, const DetectionSet& dets,
                                   double classification_ms, MonoTime started) {
    double description_ms = 0.0;
    std::string description = inference_->describe(frame, dets, description_ms);

    const WallTime now = clock_.wallNow();
    Event draft;
    draft.event_id = generateEventId(now);
    draft.camera_id = config_.camera_id;
    draft.timestamp = frame.capture_time == WallTime{} ? now : frame.capture_time;
    draft.motion_confidence = motion.confidence;
    draft.detections = dets;
    draft.description = std::move(description);
    draft.frame_id = frame.frame_id;
    draft.classification_ms = classification_ms;
    draft.description_ms = description_ms;

    std::string image_path;
    if (!snapshots_.save(frame, dets, draft.event_id, draft.timestamp, image_path)) {
        VIGIL_LOG_WARN("pipeline") << "event " << draft.event_id << " has no snapshot";
    }
    draft.image_path = image_path;

    EventPtr event = makeEvent(std::move(draft), now);
    const bool delivered = dispatcher_.dispatch(*event);
    metrics_.recordFrameLatency(elapsedMs(started, clock_.now()));
    if (!delivered) {
        VIGIL_LOG_ERROR("pipeline") << "event " << event->event_id << " lost: primary sink failed";
        return false;
    }
    metrics_.eventEmitted();
    VIGIL_LOG_INFO("pipeline") << "event " << event->event_id << ": " << eventTitle(*event)
                               << " [" << Deduplicator::signatureOf(Deduplicator::labelsOf(dets)) << "]";

    try {
        if (storage_.onEventEmitted() == StorageLevel::Critical) {
            fail(ExitReason::StorageFull, storage_.diagnostic());
        }
    } catch (const std::exception& ex) {
        VIGIL_LOG_ERROR("pipeline") << "storage check failed: " << ex.what();
    }
    return true;
}

void PipelineSupervisor::tick() {
    const MonoTime now = clock_.now();
    if (now < next_metrics_) return;
    next_metrics_ = now + std::chrono::seconds(config_.metrics_interval_s);
    publishMetrics();
}

MetricsSnapshot PipelineSupervisor::publishMetrics() {
    MetricsSnapshot snap = metrics_.snapshot(unixMillis(clock_.wallNow()));
    snap.queue_depth = static_cast<int>(queue_.size());
    snap.process = process_.sample();
    VIGIL_LOG_INFO("metrics") << formatSnapshot(snap);
    if (metrics_sink_) {
        try {
            metrics_sink_->write(snap);
        } catch (const std::exception& ex) {
            VIGIL_LOG_WARN("metrics") << "sink write failed: " << ex.what();
        }
    }
    return snap;
}

void PipelineSupervisor::drain() {
    requestShutdown();
    stopping();
    state_.store(PipelineState::Draining);
    VIGIL_LOG_INFO("pipeline") << "draining (" << queue_.size() << " queued frames discarded, reason="
                               << exitReasonName(exit_reason_) << ")";
    acquisition_stop_.store(true);
    queue_.stop();

    dispatcher_.flushAll();
    try {
        publishMetrics();
    } catch (const std::exception& ex) {
        VIGIL_LOG_WARN("pipeline") << "final metrics snapshot failed: " << ex.what();
    }

    if (acquisition_thread_.joinable()) {
        const auto poll = std::chrono::milliseconds(config_.poll_interval_ms);
        std::unique_lock<std::mutex> lk(acq_mu_);
        while (!acquisition_done_.load() && clock_.now() < drain_deadline_) {
            acq_cv_.wait_for(lk, poll);
        }
        const bool done = acquisition_done_.load();
        lk.unlock();
        if (done) {
            acquisition_thread_.join();
        } else {
            // Left joinable: the destructor waits for the source to return
            drain_timed_out_ = true;
            std::ostringstream oss;
            oss << "drain exceeded " << config_.drain_timeout_ms << "ms ceiling; acquisition did not stop";
            if (exit_reason_ == ExitReason::Clean) {
                exit_reason_ = ExitReason::DrainTimeout;
                diagnostic_ = oss.str();
            }
            VIGIL_LOG_ERROR("pipeline") << oss.str();
        }
    }
    state_.store(PipelineState::Stopped);
    VIGIL_LOG_INFO("pipeline") << "stopped";
}

bool PipelineSupervisor::applyConfig(const PipelineConfig& next, std::string& error) {
    if (!validateConfig(next, error)) return false;
    PipelineConfig applied = next;
    if (applied.camera_url != config_.camera_url) {
        VIGIL_LOG_WARN("config") << "camera_url change requires restart; keeping current source";
        applied.camera_url = config_.camera_url;
    }
    if (applied.data_dir != config_.data_dir) {
        VIGIL_LOG_WARN("config") << "data_dir change requires restart; keeping " << config_.data_dir;
        applied.data_dir = config_.data_dir;
    }
    if (applied.metrics_path != config_.metrics_path) {
        VIGIL_LOG_WARN("config") << "metrics_path change requires restart; keeping " << config_.metrics_path;
        applied.metrics_path = config_.metrics_path;
    }

    motion_.setThreshold(applied.motion_threshold);
    sampler_.setRate(applied.sampling_rate);
    dedup_.setWindow(std::chrono::seconds(applied.suppression_window_s));
    dedup_.setOverlap(applied.dedup_overlap);
    dedup_.setRefreshOnSuppress(applied.refresh_on_suppress);
    inference_->setOptions(inference_options(applied));
    queue_.setCapacity(static_cast<size_t>(applied.queue_capacity));
    if (reconnect_) reconnect_->setPolicy(ReconnectPolicy::fromConfig(applied));
    storage_.setLimits(applied.maxStorageBytes(), applied.min_retention_days, applied.storage_check_interval);
    if (applied.metrics_interval_s != config_.metrics_interval_s) {
        next_metrics_ = clock_.now() + std::chrono::seconds(applied.metrics_interval_s);
    }
    LogLevel level;
    if (parseLogLevel(applied.log_level, level)) setLogLevel(level);

    config_ = applied;
    return true;
}

bool PipelineSupervisor::reloadConfig() {
    const PipelineState previous = state_.load();
    state_.store(PipelineState::ReloadingConfig);
    bool ok = false;
    std::string error;
    PipelineConfig next;
    if (!config_source_) {
        error = "no config source to reload from";
    } else {
        try {
            ok = config_source_->load(next, error) && applyConfig(next, error);
        } catch (const std::exception& ex) {
            ok = false;
            error = ex.what();
        }
    }
    if (ok) {
        VIGIL_LOG_INFO("config") << "reloaded from " << config_source_->describe();
    } else {
        VIGIL_LOG_ERROR("config") << "reload rejected: " << error << "; keeping previous configuration";
    }
    state_.store(previous == PipelineState::ReloadingConfig ? PipelineState::Running : previous);
    return ok;
}

} // namespace vigil
