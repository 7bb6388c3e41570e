#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

namespace vigil {

/**
 * @file config.hpp
 * @brief Pipeline configuration, YAML loading and validation.
 */

/**
 * @brief Reaction to the reconnect supervisor reaching its failure limit.
 */
enum class FatalPolicy {
    Exit,  //!< Stop the pipeline with ExitReason::ReconnectFatal.
    Retry  //!< Keep reconnecting at the capped backoff interval.
};

/**
 * @brief Pipeline configuration aggregated from the YAML file and CLI flags.
 */
struct PipelineConfig {
    // Source
    std::string camera_url;          // rtsp://, http:// or file path
    std::string camera_id;           // Tag copied into every event

    // Motion gate and sampling
    double motion_threshold;         // Foreground fraction for has_motion
    int sampling_rate;               // Forward every k-th motion frame

    // Deduplication
    int suppression_window_s;        // Window for repeated label sets
    double dedup_overlap;            // Jaccard threshold
    bool refresh_on_suppress;        // Suppressed sightings extend the window

    // Inference
    std::vector<std::string> blacklist_objects; // Labels never reported
    double min_object_confidence;    // Drop weaker detections
    int classification_timeout_ms;
    int description_timeout_ms;

    // Acquisition
    int queue_capacity;
    int read_timeout_ms;             // Stalled read counts as a failure
    int backoff_initial_ms;
    int backoff_max_ms;
    int max_reconnect_failures;
    FatalPolicy fatal_policy;

    // Storage
    std::string data_dir;            // Root of YYYY-MM-DD partitions
    double max_storage_gb;
    int min_retention_days;
    int storage_check_interval;      // Events between usage checks

    // Metrics
    int metrics_interval_s;
    std::string metrics_path;        // JSONL metrics output

    // Lifecycle
    int drain_timeout_ms;
    int poll_interval_ms;
    std::string log_level;           // debug, info, warn, error

    PipelineConfig() :
        camera_url(""),
        camera_id("camera_1"),
        motion_threshold(0.02),
        sampling_rate(1),
        suppression_window_s(30),
        dedup_overlap(0.80),
        refresh_on_suppress(false),
        min_object_confidence(0.5),
        classification_timeout_ms(1000),
        description_timeout_ms(10000),
        queue_capacity(100),
        read_timeout_ms(5000),
        backoff_initial_ms(1000),
        backoff_max_ms(8000),
        max_reconnect_failures(5),
        fatal_policy(FatalPolicy::Exit),
        data_dir("data/events"),
        max_storage_gb(4.0),
        min_retention_days(7),
        storage_check_interval(100),
        metrics_interval_s(60),
        metrics_path("logs/metrics.json"),
        drain_timeout_ms(10000),
        poll_interval_ms(100),
        log_level("info") {}

    /** @brief Storage ceiling in bytes (GiB based). */
    unsigned long long maxStorageBytes() const;
};

const char* fatalPolicyName(FatalPolicy policy);
bool parseFatalPolicy(const std::string& name, FatalPolicy& out);

/**
 * @brief Merge keys from a YAML file into @p config; absent keys keep their value.
 * @param error Filled with a one-line reason on failure.
 * @return False when the file is missing, unparsable or has mistyped keys.
 */
bool loadConfigFile(const std::string& path, PipelineConfig& config, std::string& error);

/**
 * @brief Parse YAML text instead of a file; used by tests and --dry-run.
 */
bool loadConfigString(const std::string& yaml, PipelineConfig& config, std::string& error);

/**
 * @brief Check every field against its allowed range.
 * @param error Receives the first violation found.
 */
bool validateConfig(const PipelineConfig& config, std::string& error);

/**
 * @brief Source of configuration used at startup and on reload requests.
 * @threading Called from the pipeline thread only.
 */
class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    /**
     * @brief Produce a fresh configuration.
     * @param config Starts at defaults; filled on success.
     */
    virtual bool load(PipelineConfig& config, std::string& error) = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Loads a YAML file and reapplies CLI overrides on every load.
 */
class YamlConfigSource : public IConfigSource {
public:
    explicit YamlConfigSource(std::string path);

    /** @brief Log level forced from the command line; empty keeps the file value. */
    void setLogLevelOverride(const std::string& level) { log_level_override_ = level; }
    /** @brief Metrics interval forced from the command line; 0 keeps the file value. */
    void setMetricsIntervalOverride(int seconds) { metrics_interval_override_ = seconds; }

    bool load(PipelineConfig& config, std::string& error) override;
    std::string describe() const override { return path_; }

private:
    std::string path_;
    std::string log_level_override_;
    int metrics_interval_override_ = 0;
};

} // namespace vigil

#endif // CONFIG_HPP
