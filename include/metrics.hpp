#ifndef METRICS_HPP
#define METRICS_HPP

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

/**
 * @file metrics.hpp
 * @brief Rolling timers, monotonic counters and the JSONL metrics sink.
 *
 * Counters are atomics because the acquisition thread reports dropped frames
 * while the pipeline thread reports everything else. Timer windows copy their
 * samples under a short lock and compute statistics outside it, so a snapshot
 * never observes a half-updated window.
 */

/**
 * @brief Fixed-capacity ring of latency samples in milliseconds.
 * @threading Safe for concurrent add() and stats().
 */
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity = 1000);

    void add(double ms);

    /** @brief Mean, p95, min and max over the retained samples. */
    TimerStats stats() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mu_;
    std::vector<double> samples_;
    size_t capacity_;
    size_t next_ = 0;   //!< Overwrite position once full.
};

/**
 * @brief Percentile with linear interpolation between neighbouring ranks.
 * @param p Fraction in [0, 1].
 */
double percentile(std::vector<double> v, double p);

/**
 * @brief Counters and timers for the whole pipeline.
 * @ownership Created by the supervisor and passed by reference to every stage.
 */
class MetricsAggregator {
public:
    static constexpr size_t kWindowSize = 1000;

    MetricsAggregator();

    void frameSeen() { frames_seen_.fetch_add(1); }
    void motionFrame() { motion_frames_.fetch_add(1); }
    void frameSampled() { frames_sampled_.fetch_add(1); }
    void eventEmitted() { events_emitted_.fetch_add(1); }
    void eventSuppressed() { events_suppressed_.fetch_add(1); }
    void framesDropped(uint64_t n = 1) { frames_dropped_.fetch_add(n); }
    void frameError() { frame_errors_.fetch_add(1); }
    void sinkFailure() { sink_failures_.fetch_add(1); }
    void reconnectAttempt() { reconnect_attempts_.fetch_add(1); }

    void recordClassification(double ms) { classification_.add(ms); }
    void recordDescription(double ms) { description_.add(ms); }
    void recordFrameLatency(double ms) { frame_latency_.add(ms); }
    void recordMotion(double ms) { motion_.add(ms); }

    uint64_t framesSeen() const { return frames_seen_.load(); }
    uint64_t motionFrames() const { return motion_frames_.load(); }
    uint64_t framesSampled() const { return frames_sampled_.load(); }
    uint64_t eventsEmitted() const { return events_emitted_.load(); }
    uint64_t eventsSuppressed() const { return events_suppressed_.load(); }
    uint64_t framesDroppedCount() const { return frames_dropped_.load(); }
    uint64_t frameErrors() const { return frame_errors_.load(); }
    uint64_t sinkFailures() const { return sink_failures_.load(); }
    uint64_t reconnectAttempts() const { return reconnect_attempts_.load(); }

    /**
     * @brief Build an immutable point-in-time view.
     * @param timestamp_ms Wall-clock stamp recorded in the snapshot.
     */
    MetricsSnapshot snapshot(int64_t timestamp_ms) const;

private:
    std::atomic<uint64_t> frames_seen_{0};
    std::atomic<uint64_t> motion_frames_{0};
    std::atomic<uint64_t> frames_sampled_{0};
    std::atomic<uint64_t> events_emitted_{0};
    std::atomic<uint64_t> events_suppressed_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> frame_errors_{0};
    std::atomic<uint64_t> sink_failures_{0};
    std::atomic<uint64_t> reconnect_attempts_{0};

    RollingWindow classification_;
    RollingWindow description_;
    RollingWindow frame_latency_;
    RollingWindow motion_;
};

/**
 * @brief Samples CPU time, resident memory and uptime of this process.
 *
 * CPU comes from getrusage(), memory from /proc/self/statm and /proc/meminfo.
 * Fields that cannot be read stay at zero.
 * @threading Safe for concurrent sample() calls.
 */
class ProcessMonitor {
public:
    static constexpr size_t kHistorySize = 100;

    ProcessMonitor();

    ProcessStats sample();

    /** @brief User plus system CPU seconds consumed so far. */
    static double cpuSeconds();
    /** @brief Resident set size in MB, 0 when unavailable. */
    static double residentMb();
    /** @brief MemTotal in MB, 0 when unavailable. */
    static double totalMemoryMb();

private:
    std::mutex mu_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_at_;
    double last_cpu_s_;
    int64_t start_time_ms_;
    double overhead_cpu_s_ = 0.0;
    std::deque<double> history_;
};

/** @brief One-line human summary of a snapshot for the log. */
std::string formatSnapshot(const MetricsSnapshot& m);

/**
 * @brief Append-only consumer of periodic snapshots.
 */
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;
    virtual void write(const MetricsSnapshot& m) = 0;
};

/**
 * @brief Writes metrics snapshots into a JSON Lines file.
 * @threading Safe for concurrent calls; guards with an internal mutex.
 * @lifecycle Construct once per pipeline; parent directories are created.
 */
class JSONLMetricsWriter : public IMetricsSink {
public:
    /**
     * @brief Open output file for append.
     * @param path Destination JSONL file path.
     */
    explicit JSONLMetricsWriter(const std::string& path);
    ~JSONLMetricsWriter() override;

    bool isOpen() const { return ofs_.is_open(); }

    /**
     * @brief Append one metrics record as a single JSON line.
     * @param m Metrics snapshot; function serializes and flushes.
     */
    void write(const MetricsSnapshot& m) override;

private:
    std::ofstream ofs_; //!< Owned JSONL stream.
    std::mutex mu_;     //!< Protects interleaved write() calls.
};

} // namespace vigil

#endif // METRICS_HPP
