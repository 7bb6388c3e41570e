#include "config.hpp"
#include "capture.hpp"
#include "events.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "version.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

/**
 * @file main.cpp
 * @brief CLI entry point: load config, wire collaborators and run the supervisor.
 */

extern "C" {
#include <libavutil/log.h>
}

using namespace vigil;

static std::atomic<PipelineSupervisor*> g_supervisor{nullptr};
static std::atomic<bool> g_early_stop{false};

/** @brief SIGINT/SIGTERM request a drain; SIGHUP requests a config reload. */
void signal_handler(int sig) {
    PipelineSupervisor* sup = g_supervisor.load();
    if (sig == SIGHUP) {
        if (sup) sup->requestReload();
        return;
    }
    if (sup) {
        sup->requestShutdown();
    } else {
        g_early_stop.store(true);
    }
}

/** @brief Print CLI usage with supported flags and defaults. */
void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --config path.yaml [options]\n"
              << "\nOptions:\n"
              << "  --config path                     YAML configuration file (required)\n"
              << "  --log-level debug|info|warn|error Override log_level from the file\n"
              << "  --metrics-interval SEC            Override metrics_interval_s (1-86400)\n"
              << "  --dry-run                         Validate config and run health checks, then exit\n"
              << "  --version                         Print version and exit\n"
              << "  --help                            Show this help\n"
              << "\nSignals: SIGINT/SIGTERM drain and exit, SIGHUP reloads the configuration.\n"
              << "Exit codes: 0 ok, 1 error, 2 invalid configuration, 3 storage full.\n";
}

namespace {

constexpr int kCliUserError = 2;

struct CliOptions {
    std::string config_path;
    std::string log_level;
    int metrics_interval_s = 0;
    bool dry_run = false;
};

/** @brief Print error, usage, and exit with CLI failure code. */
[[noreturn]] void cli_error(const char* program, const std::string& message) {
    if (!message.empty()) {
        std::cerr << message << std::endl;
    }
    print_usage(program);
    std::exit(kCliUserError);
}

/** @brief Parse integer argument with bounds checking. */
int parse_int_option(const char* program, const std::string& opt, const std::string& value,
                     int min_value, int max_value) {
    if (value.empty()) {
        cli_error(program, "Missing value for " + opt);
    }
    long long parsed = 0;
    try {
        size_t idx = 0;
        parsed = std::stoll(value, &idx, 10);
        if (idx != value.size()) {
            cli_error(program, "Invalid integer for " + opt + ": " + value);
        }
    } catch (const std::exception&) {
        cli_error(program, "Invalid integer for " + opt + ": " + value);
    }
    if (parsed < static_cast<long long>(min_value) || parsed > static_cast<long long>(max_value)) {
        std::ostringstream oss;
        oss << "Value for " << opt << " must be between " << min_value << " and " << max_value;
        cli_error(program, oss.str());
    }
    return static_cast<int>(parsed);
}

/** @brief Fetch next CLI token, erroring if absent. */
std::string require_value(int& index, int argc, char* argv[], const std::string& opt, const char* program) {
    if (index + 1 >= argc) {
        cli_error(program, "Missing value for " + opt);
    }
    return argv[++index];
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions cli;
    const char* program = argv[0];
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(program);
            std::exit(0);
        } else if (arg == "--version") {
            std::cout << "vigil " << kVersion << std::endl;
            std::exit(0);
        } else if (arg == "--config") {
            cli.config_path = require_value(i, argc, argv, arg, program);
        } else if (arg == "--log-level") {
            cli.log_level = require_value(i, argc, argv, arg, program);
            LogLevel level;
            if (!parseLogLevel(cli.log_level, level)) {
                cli_error(program, "Invalid value for --log-level: " + cli.log_level);
            }
        } else if (arg == "--metrics-interval") {
            cli.metrics_interval_s = parse_int_option(program, arg, require_value(i, argc, argv, arg, program),
                                                      1, 86400);
        } else if (arg == "--dry-run") {
            cli.dry_run = true;
        } else {
            cli_error(program, "Unknown option: " + arg);
        }
    }
    if (cli.config_path.empty()) {
        cli_error(program, "Missing required --config");
    }
    return cli;
}

} // namespace

/**
 * @brief Program entry: parse CLI, load config, start the supervisor and map its exit reason.
 */
int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    // Reduce FFmpeg log verbosity by default
    av_log_set_level(AV_LOG_ERROR);

    CliOptions cli = parse_args(argc, argv);

    YamlConfigSource source(cli.config_path);
    source.setLogLevelOverride(cli.log_level);
    source.setMetricsIntervalOverride(cli.metrics_interval_s);

    PipelineConfig config;
    std::string error;
    if (!source.load(config, error) || !validateConfig(config, error)) {
        std::cerr << "[FATAL] invalid configuration: " << error << std::endl;
        return exitCodeFor(ExitReason::InvalidConfig);
    }
    if (config.log_level == "debug") av_log_set_level(AV_LOG_INFO);

    std::cout << "vigil " << kVersion << "\n"
              << "============================================\n"
              << "Config: " << cli.config_path << "\n"
              << "Camera: " << config.camera_id << " (" << redactUrl(config.camera_url) << ")\n"
              << "Data dir: " << config.data_dir << " (max " << config.max_storage_gb << " GB, keep "
              << config.min_retention_days << " days)\n"
              << "Motion threshold: " << config.motion_threshold << ", sampling 1/" << config.sampling_rate << "\n"
              << "Suppression window: " << config.suppression_window_s << "s\n"
              << "============================================\n" << std::endl;

    Collaborators collab;
    collab.source = createFrameSource(config.camera_url, std::chrono::milliseconds(config.read_timeout_ms));
    collab.sinks.push_back(std::make_unique<JsonlEventSink>(config.data_dir));
    collab.sinks.push_back(std::make_unique<PlaintextEventSink>(config.data_dir));
    auto metrics_writer = std::make_unique<JSONLMetricsWriter>(config.metrics_path);
    if (metrics_writer->isOpen()) {
        collab.metrics_sink = std::move(metrics_writer);
    } else {
        VIGIL_LOG_WARN("main") << "metrics file " << config.metrics_path << " unavailable; logging only";
    }

    PipelineSupervisor supervisor(config, std::move(collab), systemClock(), &source);

    if (cli.dry_run) {
        const bool ok = supervisor.runHealthChecks(error);
        if (ok) {
            std::cout << "Dry run OK: configuration valid, sinks writable, source reachable" << std::endl;
            return 0;
        }
        std::cerr << "[FATAL] dry run failed: " << error << std::endl;
        return 1;
    }

    g_supervisor.store(&supervisor);
    if (g_early_stop.load()) supervisor.requestShutdown();

    if (!supervisor.start(error)) {
        g_supervisor.store(nullptr);
        std::cerr << "[FATAL] " << supervisor.diagnostic() << std::endl;
        return exitCodeFor(ExitReason::HealthCheckFailed);
    }

    const ExitReason reason = supervisor.run();
    g_supervisor.store(nullptr);

    const MetricsAggregator& m = supervisor.metrics();
    std::cout << "\nDone." << std::endl;
    std::cout << "Frames: " << m.framesSeen() << ", motion: " << m.motionFrames() << ", sampled: "
              << m.framesSampled() << ", dropped: " << m.framesDroppedCount() << std::endl;
    std::cout << "Events: " << m.eventsEmitted() << ", suppressed: " << m.eventsSuppressed() << std::endl;

    const int code = exitCodeFor(reason);
    if (reason != ExitReason::Clean) {
        std::cerr << "[FATAL] " << exitReasonName(reason) << ": " << supervisor.diagnostic() << std::endl;
    }
    if (supervisor.drainTimedOut()) {
        // Acquisition thread may still be inside the source; destroying the supervisor would block on it
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(code);
    }
    return code;
}
