#include "metrics.hpp"
#include "format.hpp"
#include "log.hpp"
#include "version.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include <sys/resource.h>
#include <unistd.h>

/**
 * @file metrics.cpp
 * @brief Rolling window statistics and JSONL metrics writer with deterministic schema.
 */

namespace vigil {

double percentile(std::vector<double> v, double p) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    const double pos = std::clamp(p, 0.0, 1.0) * (v.size() - 1);
    const size_t lo = (size_t)pos;
    const size_t hi = std::min(lo + 1, v.size() - 1);
    return v[lo] + (pos - (double)lo) * (v[hi] - v[lo]);
}

RollingWindow::RollingWindow(size_t capacity) : capacity_(capacity < 1 ? 1 : capacity) {
    samples_.reserve(capacity_);
}

void RollingWindow::add(double ms) {
    std::lock_guard<std::mutex> lock(mu_);
    if (samples_.size() < capacity_) {
        samples_.push_back(ms);
    } else {
        samples_[next_] = ms;
        next_ = (next_ + 1) % capacity_;
    }
}

size_t RollingWindow::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return samples_.size();
}

TimerStats RollingWindow::stats() const {
    std::vector<double> copy;
    {
        std::lock_guard<std::mutex> lock(mu_);
        copy = samples_;
    }
    TimerStats s;
    if (copy.empty()) return s;
    s.count = copy.size();
    double sum = 0.0;
    s.min = copy.front();
    s.max = copy.front();
    for (double v : copy) {
        sum += v;
        s.min = std::min(s.min, v);
        s.max = std::max(s.max, v);
    }
    s.mean = sum / copy.size();
    s.p95 = percentile(std::move(copy), 0.95);
    return s;
}

MetricsAggregator::MetricsAggregator()
    : classification_(kWindowSize),
      description_(kWindowSize),
      frame_latency_(kWindowSize),
      motion_(kWindowSize) {}

MetricsSnapshot MetricsAggregator::snapshot(int64_t timestamp_ms) const {
    MetricsSnapshot m;
    m.timestamp_ms = timestamp_ms;
    m.counters = {
        {"frames_seen", frames_seen_.load()},
        {"motion_frames", motion_frames_.load()},
        {"frames_sampled", frames_sampled_.load()},
        {"events_emitted", events_emitted_.load()},
        {"events_suppressed", events_suppressed_.load()},
        {"frames_dropped", frames_dropped_.load()},
        {"frame_errors", frame_errors_.load()},
        {"sink_failures", sink_failures_.load()},
        {"reconnect_attempts", reconnect_attempts_.load()}
    };
    m.timers = {
        {"classification", classification_.stats()},
        {"description", description_.stats()},
        {"frame_latency", frame_latency_.stats()},
        {"motion", motion_.stats()}
    };
    const uint64_t seen = m.counters["frames_seen"];
    m.motion_rate = seen > 0 ? (double)m.counters["motion_frames"] / (double)seen : 0.0;
    return m;
}

ProcessMonitor::ProcessMonitor()
    : started_(std::chrono::steady_clock::now()),
      last_at_(started_),
      last_cpu_s_(cpuSeconds()),
      start_time_ms_(unixMillis(std::chrono::system_clock::now())) {}

double ProcessMonitor::cpuSeconds() {
    struct rusage ru;
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return ru.ru_utime.tv_sec + ru.ru_utime.tv_usec / 1e6 + ru.ru_stime.tv_sec + ru.ru_stime.tv_usec / 1e6;
}

double ProcessMonitor::residentMb() {
    std::ifstream statm("/proc/self/statm");
    long pages_total = 0;
    long pages_resident = 0;
    if (!(statm >> pages_total >> pages_resident)) return 0.0;
    const long page = sysconf(_SC_PAGESIZE);
    if (page <= 0) return 0.0;
    return (double)pages_resident * (double)page / (1024.0 * 1024.0);
}

double ProcessMonitor::totalMemoryMb() {
    std::ifstream meminfo("/proc/meminfo");
    std::string key;
    long kb = 0;
    std::string unit;
    while (meminfo >> key >> kb >> unit) {
        if (key == "MemTotal:") return (double)kb / 1024.0;
    }
    return 0.0;
}

ProcessStats ProcessMonitor::sample() {
    const double begin_cpu = cpuSeconds();
    const auto now = std::chrono::steady_clock::now();
    const double rss = residentMb();
    const double total = totalMemoryMb();

    std::lock_guard<std::mutex> lock(mu_);
    ProcessStats s;
    const double interval_s = std::chrono::duration<double>(now - last_at_).count();
    if (interval_s > 0.0) s.cpu_percent = std::max(0.0, (begin_cpu - last_cpu_s_) / interval_s * 100.0);
    last_at_ = now;
    last_cpu_s_ = begin_cpu;

    history_.push_back(s.cpu_percent);
    if (history_.size() > kHistorySize) history_.pop_front();
    double sum = 0.0;
    for (double v : history_) sum += v;
    s.cpu_percent_avg = sum / history_.size();

    s.rss_mb = rss;
    s.memory_percent = total > 0.0 ? rss / total * 100.0 : 0.0;
    s.start_time_ms = start_time_ms_;
    s.uptime_s = std::chrono::duration<double>(now - started_).count();

    overhead_cpu_s_ += std::max(0.0, cpuSeconds() - begin_cpu);
    s.overhead_percent = s.uptime_s > 0.0 ? overhead_cpu_s_ / s.uptime_s * 100.0 : 0.0;
    return s;
}

std::string formatSnapshot(const MetricsSnapshot& m) {
    auto counter = [&](const char* k) -> uint64_t {
        auto it = m.counters.find(k);
        return it == m.counters.end() ? 0 : it->second;
    };
    auto timer = [&](const char* k) -> TimerStats {
        auto it = m.timers.find(k);
        return it == m.timers.end() ? TimerStats{} : it->second;
    };
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "frames=" << counter("frames_seen")
        << " motion=" << counter("motion_frames") << " (" << m.motion_rate * 100.0 << "%)"
        << " events=" << counter("events_emitted")
        << " suppressed=" << counter("events_suppressed")
        << " dropped=" << counter("frames_dropped")
        << " classify_p95=" << timer("classification").p95 << "ms"
        << " describe_p95=" << timer("description").p95 << "ms"
        << " latency_avg=" << timer("frame_latency").mean << "ms"
        << " cpu=" << m.process.cpu_percent << "%"
        << " rss=" << m.process.rss_mb << "MB"
        << " uptime=" << (int64_t)m.process.uptime_s << "s";
    return oss.str();
}

/**
 * @brief Open JSONL file for append, creating parent directories.
 */
JSONLMetricsWriter::JSONLMetricsWriter(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            VIGIL_LOG_WARN("metrics") << "cannot create directory for " << path << ": " << ec.message();
        }
    }
    ofs_.open(path, std::ios::out | std::ios::app);
    if (!ofs_.is_open()) {
        VIGIL_LOG_WARN("metrics") << "cannot open " << path << "; snapshots will only be logged";
    }
}

JSONLMetricsWriter::~JSONLMetricsWriter() {
    if (ofs_.is_open()) ofs_.close();
}

/**
 * @brief Serialize metrics snapshot to JSONL using fixed key order.
 */
void JSONLMetricsWriter::write(const MetricsSnapshot& m) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!ofs_.is_open()) return;

    ofs_ << '{'
         << "\"ts_ms\":" << m.timestamp_ms << ','
         << "\"version\":\"" << jsonEscape(kVersion) << "\","
         << "\"motion_rate\":" << std::fixed << std::setprecision(4) << m.motion_rate << ','
         << "\"queue_depth\":" << m.queue_depth << ',';

    const ProcessStats& p = m.process;
    ofs_ << "\"process\":{"
         << "\"cpu_percent\":" << std::fixed << std::setprecision(2) << p.cpu_percent << ','
         << "\"cpu_percent_avg\":" << p.cpu_percent_avg << ','
         << "\"rss_mb\":" << p.rss_mb << ','
         << "\"memory_percent\":" << p.memory_percent << ','
         << "\"start_time_ms\":" << p.start_time_ms << ','
         << "\"uptime_s\":" << p.uptime_s << ','
         << "\"overhead_percent\":" << std::setprecision(4) << p.overhead_percent
         << "},";

    ofs_ << "\"counters\":{";
    bool first = true;
    for (const auto& kv : m.counters) {
        if (!first) ofs_ << ',';
        first = false;
        ofs_ << '"' << jsonEscape(kv.first) << "\":" << kv.second;
    }
    ofs_ << "},";

    ofs_ << "\"timers_ms\":{";
    first = true;
    for (const auto& kv : m.timers) {
        if (!first) ofs_ << ',';
        first = false;
        const TimerStats& t = kv.second;
        ofs_ << '"' << jsonEscape(kv.first) << "\":{"
             << "\"count\":" << t.count << ','
             << "\"mean\":" << std::fixed << std::setprecision(2) << t.mean << ','
             << "\"p95\":" << std::fixed << std::setprecision(2) << t.p95 << ','
             << "\"min\":" << std::fixed << std::setprecision(2) << t.min << ','
             << "\"max\":" << std::fixed << std::setprecision(2) << t.max
             << '}';
    }
    ofs_ << "}}" << '\n';
    ofs_.flush();
}

} // namespace vigil
