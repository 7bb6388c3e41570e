#ifndef TYPES_HPP
#define TYPES_HPP

#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vigil {

/**
 * @file types.hpp
 * @brief Common structs shared across pipeline stages.
 */

using WallTime = std::chrono::system_clock::time_point;
using MonoTime = std::chrono::steady_clock::time_point;

/**
 * @brief Decoded video frame flowing from acquisition to the pipeline consumer.
 * @ownership Moved between stages; exactly one stage holds a frame at a time.
 */
struct Frame {
    uint64_t frame_id = 0;  //!< Monotonic per-process sequence number.
    cv::Mat image;          //!< BGR payload.
    WallTime capture_time;  //!< Wall-clock capture timestamp (UTC).
    MonoTime mono_time;     //!< Monotonic capture timestamp used for latency.
};

/**
 * @brief Axis-aligned box in source frame pixels.
 */
struct BoundingBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

/**
 * @brief Single labelled detection returned by a classifier.
 */
struct Detection {
    std::string label;
    float confidence = 0.0f; //!< Range [0, 1].
    BoundingBox bbox;
};

using DetectionSet = std::vector<Detection>;

/**
 * @brief Output of the motion gate for one frame.
 */
struct MotionResult {
    bool has_motion = false;
    double confidence = 0.0;      //!< Fraction of foreground pixels, [0, 1].
    uint64_t frame_id = 0;
};

/**
 * @brief Immutable record of a notable detection.
 * @ownership Created once by makeEvent() and shared read-only afterwards.
 */
struct Event {
    std::string event_id;          //!< evt_<unix-ms>_<4 hex>.
    std::string camera_id;
    WallTime timestamp;            //!< Capture time of the triggering frame.
    double motion_confidence = 0.0;
    DetectionSet detections;
    std::string description;
    std::string image_path;        //!< Annotated snapshot, empty when not saved.
    WallTime created_at;
    uint64_t frame_id = 0;
    double classification_ms = 0.0;
    double description_ms = 0.0;
};

using EventPtr = std::shared_ptr<const Event>;

/**
 * @brief Point-in-time disk usage of the event data root.
 */
struct StorageSnapshot {
    uint64_t total_bytes = 0;
    uint64_t limit_bytes = 0;
    double percent_used = 0.0;
    bool is_over_limit = false;
};

/**
 * @brief Storage ceiling and retention floor reported together.
 */
struct RetentionStatus {
    StorageSnapshot snapshot;
    int partitions_total = 0;
    int partitions_deletable = 0;  //!< Older than today and above the floor.
    int min_retention_days = 0;
    bool floor_binding = false;    //!< Rotation stopped because of the floor.
    bool ceiling_exceeded = false;
    bool conflict = false;         //!< Floor prevents reaching the rotation target.
};

/**
 * @brief Summary statistics of one rolling timer window.
 */
struct TimerStats {
    uint64_t count = 0;
    double mean = 0.0;
    double p95 = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Resource usage of the running process.
 */
struct ProcessStats {
    double cpu_percent = 0.0;         //!< Share of one core since the previous sample.
    double cpu_percent_avg = 0.0;     //!< Mean over the last 100 samples.
    double rss_mb = 0.0;
    double memory_percent = 0.0;      //!< RSS against total system memory.
    int64_t start_time_ms = 0;        //!< Unix epoch milliseconds.
    double uptime_s = 0.0;
    double overhead_percent = 0.0;    //!< CPU spent sampling, as a share of uptime.
};

/**
 * @brief Periodic metrics record written as one JSON line.
 */
struct MetricsSnapshot {
    int64_t timestamp_ms = 0;
    std::map<std::string, uint64_t> counters;
    std::map<std::string, TimerStats> timers;
    double motion_rate = 0.0; //!< motion_frames / frames_seen.
    int queue_depth = 0;
    ProcessStats process;
};

} // namespace vigil

#endif // TYPES_HPP
