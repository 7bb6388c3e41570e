#include "metrics.hpp"
#include "test_support.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace vigil;
using namespace vigil::testing;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    // Percentile interpolates between neighbouring ranks
    std::vector<double> v;
    for (int i = 1; i <= 100; ++i) v.push_back(i);
    assert(near(percentile(v, 0.95), 95.05));
    assert(near(percentile(v, 0.5), 50.5));
    assert(near(percentile({10.0, 20.0}, 0.25), 12.5));
    assert(near(percentile(v, 0.0), 1.0));
    assert(near(percentile(v, 1.0), 100.0));
    assert(near(percentile(v, 2.0), 100.0));
    assert(near(percentile({}, 0.5), 0.0));
    assert(near(percentile({3.0, 1.0, 2.0}, 0.5), 2.0));

    // Rolling window statistics
    RollingWindow w(1000);
    assert(w.stats().count == 0);
    for (int i = 1; i <= 100; ++i) w.add(i);
    TimerStats s = w.stats();
    assert(s.count == 100);
    assert(near(s.mean, 50.5));
    assert(near(s.p95, 95.05));
    assert(near(s.min, 1.0));
    assert(near(s.max, 100.0));

    // Window keeps only the latest 1000 samples
    RollingWindow bounded(1000);
    for (int i = 1; i <= 1500; ++i) bounded.add(i);
    s = bounded.stats();
    assert(bounded.size() == 1000);
    assert(s.count == 1000);
    assert(near(s.min, 501.0));
    assert(near(s.max, 1500.0));
    assert(near(s.mean, 1000.5));
    assert(near(s.p95, 1450.05));

    // Concurrent writers and readers
    RollingWindow shared(1000);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&shared]() {
            for (int i = 0; i < 500; ++i) shared.add(1.0);
        });
    }
    for (int i = 0; i < 50; ++i) (void)shared.stats();
    for (auto& t : writers) t.join();
    assert(shared.size() == 1000);
    assert(near(shared.stats().mean, 1.0));

    // Aggregator counters and snapshot
    MetricsAggregator m;
    for (int i = 0; i < 10; ++i) m.frameSeen();
    for (int i = 0; i < 4; ++i) m.motionFrame();
    m.frameSampled();
    m.eventEmitted();
    m.eventSuppressed();
    m.framesDropped(3);
    m.frameError();
    m.sinkFailure();
    m.reconnectAttempt();
    m.recordClassification(12.0);
    m.recordClassification(18.0);
    m.recordDescription(900.0);
    m.recordFrameLatency(20.0);
    m.recordMotion(1.5);

    MetricsSnapshot snap = m.snapshot(1234);
    assert(snap.timestamp_ms == 1234);
    assert(snap.counters.at("frames_seen") == 10);
    assert(snap.counters.at("motion_frames") == 4);
    assert(snap.counters.at("frames_dropped") == 3);
    assert(snap.counters.at("events_emitted") == 1);
    assert(snap.counters.at("events_suppressed") == 1);
    assert(snap.counters.at("reconnect_attempts") == 1);
    assert(snap.counters.size() == 9);
    assert(snap.timers.size() == 4);
    assert(snap.timers.at("classification").count == 2);
    assert(near(snap.timers.at("classification").mean, 15.0));
    assert(near(snap.motion_rate, 0.4));

    const std::string line = formatSnapshot(snap);
    assert(line.find("frames=10") != std::string::npos);
    assert(line.find("events=1") != std::string::npos);
    assert(line.find("dropped=3") != std::string::npos);

    // Empty aggregator has a zero motion rate
    MetricsAggregator idle;
    assert(near(idle.snapshot(0).motion_rate, 0.0));

    // Process resource sampling
    ProcessMonitor monitor;
    const auto spin_until = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);
    volatile double sink = 0.0;
    while (std::chrono::steady_clock::now() < spin_until) sink = sink + 1.0;
    ProcessStats ps = monitor.sample();
    assert(ps.cpu_percent > 0.0);
    assert(near(ps.cpu_percent_avg, ps.cpu_percent));
    assert(ps.rss_mb > 0.0);
    assert(ps.memory_percent > 0.0 && ps.memory_percent < 100.0);
    assert(ps.start_time_ms > 1600000000000LL);
    assert(ps.uptime_s >= 0.1);
    assert(ps.overhead_percent >= 0.0 && ps.overhead_percent < 100.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ProcessStats idle_ps = monitor.sample();
    assert(idle_ps.start_time_ms == ps.start_time_ms);
    assert(idle_ps.uptime_s > ps.uptime_s);
    assert(near(idle_ps.cpu_percent_avg, (ps.cpu_percent + idle_ps.cpu_percent) / 2.0));
    snap.process = idle_ps;
    assert(formatSnapshot(snap).find(" rss=") != std::string::npos);
    assert(formatSnapshot(snap).find(" cpu=") != std::string::npos);

    // JSONL writer appends one object per snapshot
    TempDir dir("metrics");
    const std::string path = dir.sub("logs/metrics.json");
    {
        JSONLMetricsWriter writer(path);
        assert(writer.isOpen());
        snap.queue_depth = 7;
        writer.write(snap);
        writer.write(snap);
    }
    std::ifstream in(path);
    std::string l1, l2, l3;
    std::getline(in, l1);
    std::getline(in, l2);
    assert(!std::getline(in, l3));
    assert(l1 == l2);
    assert(l1.front() == '{' && l1.back() == '}');
    assert(l1.find("\"ts_ms\":1234") != std::string::npos);
    assert(l1.find("\"queue_depth\":7") != std::string::npos);
    assert(l1.find("\"frames_seen\":10") != std::string::npos);
    assert(l1.find("\"classification\":{\"count\":2,\"mean\":15.00") != std::string::npos);
    assert(l1.find("\"motion_rate\":0.4000") != std::string::npos);
    assert(l1.find("\"process\":{\"cpu_percent\":") != std::string::npos);
    assert(l1.find("\"rss_mb\":") != std::string::npos);
    assert(l1.find("\"start_time_ms\":" + std::to_string(ps.start_time_ms)) != std::string::npos);
    assert(l1.find("\"overhead_percent\":") != std::string::npos);

    std::cout << "test_metrics: OK" << std::endl;
    return 0;
}
