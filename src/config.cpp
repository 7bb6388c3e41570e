#include "config.hpp"
#include "log.hpp"
#include <filesystem>
#include <sstream>

#include <yaml-cpp/yaml.h>

/**
 * @file config.cpp
 * @brief YAML configuration loading and range validation.
 */

namespace vigil {

namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
    if (!n || !n[key]) return;
    out = n[key].as<T>();
}

unsigned long long PipelineConfig::maxStorageBytes() const {
    return static_cast<unsigned long long>(max_storage_gb * 1024.0 * 1024.0 * 1024.0);
}

const char* fatalPolicyName(FatalPolicy policy) {
    return policy == FatalPolicy::Retry ? "retry" : "exit";
}

bool parseFatalPolicy(const std::string& name, FatalPolicy& out) {
    if (name == "exit") { out = FatalPolicy::Exit; return true; }
    if (name == "retry") { out = FatalPolicy::Retry; return true; }
    return false;
}

/** @brief Copy recognized keys from a parsed root node into the config. */
static bool apply_yaml(const YAML::Node& root, PipelineConfig& c, std::string& error) {
    if (!root || root.IsNull()) return true;  // Empty file keeps defaults
    if (!is_map(root)) {
        error = "config root must be a mapping";
        return false;
    }
    try {
        maybe_set(root, "camera_url", c.camera_url);
        maybe_set(root, "camera_id", c.camera_id);
        maybe_set(root, "motion_threshold", c.motion_threshold);
        maybe_set(root, "sampling_rate", c.sampling_rate);
        maybe_set(root, "suppression_window_s", c.suppression_window_s);
        maybe_set(root, "dedup_overlap", c.dedup_overlap);
        maybe_set(root, "refresh_on_suppress", c.refresh_on_suppress);
        maybe_set(root, "blacklist_objects", c.blacklist_objects);
        maybe_set(root, "min_object_confidence", c.min_object_confidence);
        maybe_set(root, "classification_timeout_ms", c.classification_timeout_ms);
        maybe_set(root, "description_timeout_ms", c.description_timeout_ms);
        maybe_set(root, "queue_capacity", c.queue_capacity);
        maybe_set(root, "read_timeout_ms", c.read_timeout_ms);
        maybe_set(root, "backoff_initial_ms", c.backoff_initial_ms);
        maybe_set(root, "backoff_max_ms", c.backoff_max_ms);
        maybe_set(root, "max_reconnect_failures", c.max_reconnect_failures);
        maybe_set(root, "data_dir", c.data_dir);
        maybe_set(root, "max_storage_gb", c.max_storage_gb);
        maybe_set(root, "min_retention_days", c.min_retention_days);
        maybe_set(root, "storage_check_interval", c.storage_check_interval);
        maybe_set(root, "metrics_interval_s", c.metrics_interval_s);
        maybe_set(root, "metrics_path", c.metrics_path);
        maybe_set(root, "drain_timeout_ms", c.drain_timeout_ms);
        maybe_set(root, "poll_interval_ms", c.poll_interval_ms);
        maybe_set(root, "log_level", c.log_level);

        if (root["fatal_policy"]) {
            std::string v = root["fatal_policy"].as<std::string>();
            if (!parseFatalPolicy(v, c.fatal_policy)) {
                error = "fatal_policy must be exit or retry, got '" + v + "'";
                return false;
            }
        }
    } catch (const YAML::Exception& e) {
        error = std::string("invalid value: ") + e.what();
        return false;
    }

    for (auto it : root) {
        if (!it.first.IsScalar()) {
            VIGIL_LOG_WARN("config") << "ignoring non-scalar key at line " << it.first.Mark().line + 1;
            continue;
        }
        const auto key = it.first.Scalar();
        static const char* known[] = {
            "camera_url", "camera_id", "motion_threshold", "sampling_rate",
            "suppression_window_s", "dedup_overlap", "refresh_on_suppress",
            "blacklist_objects", "min_object_confidence", "classification_timeout_ms",
            "description_timeout_ms", "queue_capacity", "read_timeout_ms",
            "backoff_initial_ms", "backoff_max_ms", "max_reconnect_failures",
            "fatal_policy", "data_dir", "max_storage_gb", "min_retention_days",
            "storage_check_interval", "metrics_interval_s", "metrics_path",
            "drain_timeout_ms", "poll_interval_ms", "log_level"
        };
        bool found = false;
        for (const char* k : known) {
            if (key == k) { found = true; break; }
        }
        if (!found) VIGIL_LOG_WARN("config") << "ignoring unknown key '" << key << "'";
    }
    return true;
}

bool loadConfigFile(const std::string& path, PipelineConfig& config, std::string& error) {
    YAML::Node root;
    try {
        if (!fs::exists(path)) {
            error = "config not found: " + path;
            return false;
        }
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        error = "YAML parse error in " + path + ": " + e.what();
        return false;
    } catch (const std::exception& e) {
        error = "failed to load " + path + ": " + e.what();
        return false;
    }
    if (!apply_yaml(root, config, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

bool loadConfigString(const std::string& yaml, PipelineConfig& config, std::string& error) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        error = std::string("YAML parse error: ") + e.what();
        return false;
    }
    return apply_yaml(root, config, error);
}

bool validateConfig(const PipelineConfig& c, std::string& error) {
    std::ostringstream oss;
    if (c.camera_url.empty()) {
        oss << "camera_url is required";
    } else if (c.camera_id.empty()) {
        oss << "camera_id must not be empty";
    } else if (c.motion_threshold < 0.0 || c.motion_threshold > 1.0) {
        oss << "motion_threshold must be in [0, 1], got " << c.motion_threshold;
    } else if (c.sampling_rate < 1) {
        oss << "sampling_rate must be >= 1, got " << c.sampling_rate;
    } else if (c.suppression_window_s <= 0) {
        oss << "suppression_window_s must be > 0, got " << c.suppression_window_s;
    } else if (c.dedup_overlap <= 0.0 || c.dedup_overlap > 1.0) {
        oss << "dedup_overlap must be in (0, 1], got " << c.dedup_overlap;
    } else if (c.min_object_confidence < 0.0 || c.min_object_confidence > 1.0) {
        oss << "min_object_confidence must be in [0, 1], got " << c.min_object_confidence;
    } else if (c.classification_timeout_ms <= 0) {
        oss << "classification_timeout_ms must be > 0";
    } else if (c.description_timeout_ms <= 0) {
        oss << "description_timeout_ms must be > 0";
    } else if (c.queue_capacity < 1 || c.queue_capacity > 10000) {
        oss << "queue_capacity must be between 1 and 10000, got " << c.queue_capacity;
    } else if (c.read_timeout_ms <= 0) {
        oss << "read_timeout_ms must be > 0";
    } else if (c.backoff_initial_ms <= 0) {
        oss << "backoff_initial_ms must be > 0";
    } else if (c.backoff_max_ms < c.backoff_initial_ms) {
        oss << "backoff_max_ms must be >= backoff_initial_ms";
    } else if (c.max_reconnect_failures < 1) {
        oss << "max_reconnect_failures must be >= 1";
    } else if (c.data_dir.empty()) {
        oss << "data_dir must not be empty";
    } else if (c.max_storage_gb <= 0.0) {
        oss << "max_storage_gb must be > 0, got " << c.max_storage_gb;
    } else if (c.min_retention_days < 1) {
        oss << "min_retention_days must be >= 1, got " << c.min_retention_days;
    } else if (c.storage_check_interval < 1) {
        oss << "storage_check_interval must be >= 1";
    } else if (c.metrics_interval_s < 1) {
        oss << "metrics_interval_s must be >= 1, got " << c.metrics_interval_s;
    } else if (c.drain_timeout_ms <= 0) {
        oss << "drain_timeout_ms must be > 0";
    } else if (c.poll_interval_ms <= 0) {
        oss << "poll_interval_ms must be > 0";
    } else {
        LogLevel lvl;
        if (!parseLogLevel(c.log_level, lvl)) {
            oss << "log_level must be debug|info|warn|error, got '" << c.log_level << "'";
        }
    }
    error = oss.str();
    return error.empty();
}

YamlConfigSource::YamlConfigSource(std::string path) : path_(std::move(path)) {}

bool YamlConfigSource::load(PipelineConfig& config, std::string& error) {
    PipelineConfig fresh;
    if (!loadConfigFile(path_, fresh, error)) return false;
    if (!log_level_override_.empty()) fresh.log_level = log_level_override_;
    if (metrics_interval_override_ > 0) fresh.metrics_interval_s = metrics_interval_override_;
    config = fresh;
    return true;
}

} // namespace vigil
