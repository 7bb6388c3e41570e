#include "pipeline.hpp"
#include "test_support.hpp"
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace vigil;
using namespace vigil::testing;
namespace fs = std::filesystem;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

PipelineConfig base_config(const TempDir& dir) {
    PipelineConfig c;
    c.camera_url = "fake://camera";
    c.camera_id = "porch";
    c.data_dir = dir.sub("events");
    c.metrics_path = dir.sub("logs/metrics.json");
    c.poll_interval_ms = 10;
    c.log_level = "warn";
    return c;
}

struct Rig {
    FakeFrameSource* source = nullptr;
    MemorySink* sink = nullptr;
};

Collaborators make_collaborators(Rig& rig, std::shared_ptr<IClassifier> classifier = nullptr,
                                 std::shared_ptr<IDescriber> describer = nullptr,
                                 const std::string& metrics_path = "") {
    Collaborators c;
    auto source = std::make_unique<FakeFrameSource>();
    rig.source = source.get();
    c.source = std::move(source);
    auto sink = std::make_unique<MemorySink>("primary");
    rig.sink = sink.get();
    c.sinks.push_back(std::move(sink));
    c.classifier = std::move(classifier);
    c.describer = std::move(describer);
    if (!metrics_path.empty()) c.metrics_sink = std::make_unique<JSONLMetricsWriter>(metrics_path);
    return c;
}

/** @brief Feed the motion gate's learning phase with a static scene. */
uint64_t warm_up(PipelineSupervisor& sup) {
    uint64_t id = 0;
    for (int i = 0; i < MotionGate::kDefaultLearningFrames; ++i) {
        bool emitted = sup.processFrame(makeFrame(++id));
        assert(!emitted);
    }
    return id;
}

class StaticConfigSource : public IConfigSource {
public:
    PipelineConfig next;
    bool ok = true;
    bool load(PipelineConfig& config, std::string& error) override {
        if (!ok) {
            error = "unreadable";
            return false;
        }
        config = next;
        return true;
    }
    std::string describe() const override { return "static"; }
};

/** @brief Source that blocks in read() and ignores the interrupt flag until released. */
class HangingSource : public FakeFrameSource {
public:
    std::atomic<bool> release{false};
    std::atomic<bool> hanging{false};
    uint64_t hang_after = 3;

    ReadStatus read(Frame& frame, std::chrono::milliseconds timeout) override {
        if (frames_out.load() >= hang_after) {
            hanging.store(true);
            while (!release.load()) std::this_thread::sleep_for(milliseconds(1));
        }
        return FakeFrameSource::read(frame, timeout);
    }
};

class ThrowingConfigSource : public IConfigSource {
public:
    std::atomic<int> calls{0};
    bool load(PipelineConfig&, std::string&) override {
        ++calls;
        throw std::runtime_error("yaml-cpp: error at line 2, column 3: bad conversion");
    }
    std::string describe() const override { return "throwing"; }
};

void write_file(const std::string& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::trunc);
    ofs << text;
}

void wait_until(const std::function<bool()>& pred) {
    for (int i = 0; i < 10000 && !pred(); ++i) std::this_thread::sleep_for(milliseconds(1));
    assert(pred());
}

} // namespace

int main() {
    assert(exitCodeFor(ExitReason::Clean) == 0);
    assert(exitCodeFor(ExitReason::ReconnectFatal) == 1);
    assert(exitCodeFor(ExitReason::HealthCheckFailed) == 1);
    assert(exitCodeFor(ExitReason::InvalidConfig) == 2);
    assert(exitCodeFor(ExitReason::StorageFull) == 3);
    assert(std::string(pipelineStateName(PipelineState::Draining)) == "Draining");

    // Motion-only flow with suppression inside the window
    {
        TempDir dir("pipeline_motion");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock);
        uint64_t id = warm_up(sup);
        assert(sup.metrics().motionFrames() == 0);

        assert(sup.processFrame(makeFrame(++id, 0.5)));
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(sup.metrics().eventsSuppressed() == 1);

        clock.advance(seconds(31));
        assert(sup.processFrame(makeFrame(++id, 0.5)));

        assert(sup.metrics().framesSeen() == 103);
        assert(sup.metrics().motionFrames() == 3);
        assert(sup.metrics().eventsEmitted() == 2);
        assert(rig.sink->events.size() == 2);

        const Event& e = rig.sink->events.front();
        assert(e.camera_id == "porch");
        assert(e.frame_id == 101);
        assert(e.detections.size() == 1 && e.detections[0].label == "motion");
        assert(e.description == "Detected: motion");
        assert(e.motion_confidence >= 0.02);
        assert(!e.image_path.empty() && fs::exists(e.image_path));
        assert(e.event_id != rig.sink->events.back().event_id);

        MetricsSnapshot snap = sup.publishMetrics();
        assert(snap.counters.at("events_emitted") == 2);
        assert(snap.timers.at("frame_latency").count == 2);
    }

    // Classifier, describer and sampling
    {
        TempDir dir("pipeline_classify");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        auto classifier = std::make_shared<FakeClassifier>();
        classifier->result = {makeDetection("person", 0.75f), makeDetection("bird", 0.99f)};
        auto describer = std::make_shared<FakeDescriber>();
        PipelineConfig cfg = base_config(dir);
        cfg.sampling_rate = 2;
        cfg.motion_threshold = 0.0;  // Every post-learning frame counts as motion
        cfg.blacklist_objects = {"bird", "cat"};
        Rig rig;
        PipelineSupervisor sup(cfg, make_collaborators(rig, classifier, describer), clock);
        uint64_t id = warm_up(sup);

        assert(!sup.processFrame(makeFrame(++id, 0.5)));  // 1st motion frame not sampled
        assert(classifier->calls == 0);
        assert(sup.processFrame(makeFrame(++id, 0.5)));
        assert(classifier->calls == 1);
        assert(describer->calls == 1);
        assert(sup.metrics().framesSampled() == 1);

        const Event& e = rig.sink->events.back();
        assert(e.detections.size() == 1 && e.detections[0].label == "person");
        assert(e.description == "A person walks across the driveway.");
        assert(eventTitle(e) == "Person detected (confidence: 75%)");

        // Suppressed sets are never described
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(classifier->calls == 2);
        assert(describer->calls == 1);
        assert(sup.metrics().eventsSuppressed() == 1);

        // Only blacklisted labels: nothing to report
        classifier->result = {makeDetection("cat", 0.99f)};
        clock.advance(seconds(60));
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(rig.sink->events.size() == 1);

        // Classification failure skips the frame and counts an error
        classifier->ok = false;
        const uint64_t errors = sup.metrics().frameErrors();
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(sup.metrics().frameErrors() == errors + 1);

        // Describer failure falls back to the label list
        classifier->ok = true;
        classifier->result = {makeDetection("person", 0.75f), makeDetection("car", 0.8f)};
        describer->ok = false;
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(sup.processFrame(makeFrame(++id, 0.5)));
        assert(rig.sink->events.back().description == "Detected: person, car");
    }

    // Primary sink failure loses the event and counts a sink failure
    {
        TempDir dir("pipeline_sink");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock);
        uint64_t id = warm_up(sup);
        rig.sink->write_ok = false;
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
        assert(sup.metrics().eventsEmitted() == 0);
        assert(sup.metrics().sinkFailures() == 1);
    }

    // Storage ceiling stops the pipeline with exit code 3
    {
        TempDir dir("pipeline_storage");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        PipelineConfig cfg = base_config(dir);
        cfg.max_storage_gb = 1e-7;
        cfg.storage_check_interval = 1;
        Rig rig;
        PipelineSupervisor sup(cfg, make_collaborators(rig), clock);
        uint64_t id = warm_up(sup);
        assert(sup.processFrame(makeFrame(++id, 0.5)));
        assert(sup.storage().status().ceiling_exceeded);
        assert(sup.run() == ExitReason::StorageFull);
        assert(exitCodeFor(ExitReason::StorageFull) == 3);
        assert(sup.diagnostic().find("storage ceiling exceeded") != std::string::npos);
        // No more frames once shutdown was requested
        assert(!sup.processFrame(makeFrame(++id, 0.5)));
    }

    // Reload applies live tunables and keeps restart-only fields
    {
        TempDir dir("pipeline_reload");
        ManualClock clock;
        StaticConfigSource source;
        PipelineConfig cfg = base_config(dir);
        Rig rig;
        PipelineSupervisor sup(cfg, make_collaborators(rig), clock, &source);

        source.next = cfg;
        source.next.sampling_rate = 3;
        source.next.motion_threshold = 0.1;
        source.next.queue_capacity = 5;
        source.next.suppression_window_s = 90;
        source.next.blacklist_objects = {"dog"};
        source.next.camera_url = "rtsp://elsewhere/stream";
        source.next.data_dir = dir.sub("other");
        assert(sup.reloadConfig());
        assert(sup.config().sampling_rate == 3);
        assert(sup.motionGate().threshold() == 0.1);
        assert(sup.queue().capacity() == 5);
        assert(sup.deduplicator().window() == seconds(90));
        assert(sup.inference().options().blacklist.size() == 1);
        assert(sup.config().camera_url == "fake://camera");
        assert(sup.config().data_dir == cfg.data_dir);
        assert(sup.state() == PipelineState::Starting);

        // Invalid values are rejected as a whole
        source.next.sampling_rate = 0;
        source.next.motion_threshold = 0.3;
        assert(!sup.reloadConfig());
        assert(sup.config().sampling_rate == 3);
        assert(sup.motionGate().threshold() == 0.1);

        source.ok = false;
        assert(!sup.reloadConfig());
        assert(sup.config().sampling_rate == 3);

        std::string error;
        PipelineConfig direct = sup.config();
        direct.backoff_initial_ms = 200;
        direct.max_reconnect_failures = 2;
        assert(sup.applyConfig(direct, error));
        assert(sup.reconnect().policy().initial_backoff == milliseconds(200));
        assert(sup.reconnect().policy().max_failures == 2);
    }

    // A file with a non-scalar key still reloads; an exception from the source is rejected
    {
        TempDir dir("pipeline_reload_file");
        ManualClock clock;
        PipelineConfig cfg = base_config(dir);
        const std::string path = dir.sub("vigil.yaml");
        write_file(path, "camera_url: fake://camera\nlog_level: warn\nsampling_rate: 4\n? [a, b]\n: 1\n");
        YamlConfigSource file_source(path);
        Rig rig;
        PipelineSupervisor sup(cfg, make_collaborators(rig), clock, &file_source);
        assert(sup.reloadConfig());
        assert(sup.config().sampling_rate == 4);

        ThrowingConfigSource throwing;
        Rig rig2;
        PipelineSupervisor sup2(cfg, make_collaborators(rig2), clock, &throwing);
        assert(!sup2.reloadConfig());
        assert(throwing.calls == 1);
        assert(sup2.config().sampling_rate == 1);
        assert(sup2.state() == PipelineState::Starting);
    }

    // Reload requested while running: a throwing source leaves the pipeline up
    {
        TempDir dir("pipeline_reload_run");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        ThrowingConfigSource throwing;
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock, &throwing);
        rig.source->read_delay = milliseconds(1);
        std::string error;
        assert(sup.start(error));
        sup.requestReload();
        std::thread stopper([&]() {
            wait_until([&]() { return throwing.calls >= 1 && sup.metrics().framesSeen() >= 5; });
            sup.requestShutdown();
        });
        const ExitReason reason = sup.run();
        stopper.join();
        assert(reason == ExitReason::Clean);
        assert(sup.config().sampling_rate == 1);
    }

    // Health check failures
    {
        TempDir dir("pipeline_health");
        ManualClock clock;
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock);
        rig.source->connect_script = {false};
        std::string error;
        assert(!sup.start(error));
        assert(error.find("fake://camera") != std::string::npos);
        assert(sup.state() == PipelineState::Stopped);
        assert(sup.run() == ExitReason::HealthCheckFailed);
        assert(sup.metrics().reconnectAttempts() == 1);
    }
    {
        TempDir dir("pipeline_health_sink");
        ManualClock clock;
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock);
        rig.sink->open_ok = false;
        std::string error;
        assert(!sup.runHealthChecks(error));
        assert(error.find("primary") != std::string::npos);
        assert(rig.source->connects == 0);
    }

    // Full lifecycle: start, consume, shutdown request, drain
    {
        TempDir dir("pipeline_run");
        ManualClock clock;
        clock.setWall(std::chrono::system_clock::now());
        PipelineConfig cfg = base_config(dir);
        Rig rig;
        PipelineSupervisor sup(cfg, make_collaborators(rig, nullptr, nullptr, cfg.metrics_path), clock);
        rig.source->read_delay = milliseconds(1);

        std::string error;
        assert(sup.start(error));
        assert(sup.state() == PipelineState::Running);

        std::thread stopper([&]() {
            wait_until([&]() { return sup.metrics().framesSeen() >= 20; });
            sup.requestShutdown();
        });
        const ExitReason reason = sup.run();
        stopper.join();

        assert(reason == ExitReason::Clean);
        assert(exitCodeFor(reason) == 0);
        assert(sup.state() == PipelineState::Stopped);
        assert(!sup.drainTimedOut());
        assert(sup.queue().stopped());
        assert(rig.sink->flushes >= 1);
        assert(rig.source->closes >= 1);

        std::ifstream metrics(cfg.metrics_path);
        std::string line;
        assert(std::getline(metrics, line));
        assert(line.find("\"frames_seen\":") != std::string::npos);
    }

    // Drain ceiling: acquisition stuck in the source past the deadline
    {
        TempDir dir("pipeline_drain_timeout");
        PipelineConfig cfg = base_config(dir);
        cfg.drain_timeout_ms = 200;
        Collaborators collab;
        auto hanging = std::make_unique<HangingSource>();
        HangingSource* source = hanging.get();
        collab.source = std::move(hanging);
        collab.sinks.push_back(std::make_unique<MemorySink>("primary"));
        auto sup = std::make_unique<PipelineSupervisor>(cfg, std::move(collab), systemClock());

        std::string error;
        assert(sup->start(error));
        wait_until([&]() { return source->hanging.load(); });

        const auto t0 = std::chrono::steady_clock::now();
        sup->requestShutdown();
        const ExitReason reason = sup->run();
        const auto elapsed = std::chrono::steady_clock::now() - t0;

        assert(reason == ExitReason::DrainTimeout);
        assert(exitCodeFor(reason) == 1);
        assert(sup->drainTimedOut());
        assert(sup->state() == PipelineState::Stopped);
        assert(sup->diagnostic().find("200ms ceiling") != std::string::npos);
        assert(elapsed >= milliseconds(cfg.drain_timeout_ms));
        assert(elapsed < milliseconds(cfg.drain_timeout_ms + cfg.poll_interval_ms + 100));

        // Teardown waits for the source instead of abandoning the thread
        source->release.store(true);
        sup.reset();
    }

    // Unreachable camera under the exit policy
    {
        TempDir dir("pipeline_fatal");
        ManualClock clock;
        Rig rig;
        PipelineSupervisor sup(base_config(dir), make_collaborators(rig), clock);
        rig.source->connect_script = {true, false};
        rig.source->read_script = {ReadStatus::Closed};

        std::string error;
        assert(sup.start(error));
        const ExitReason reason = sup.run();
        assert(reason == ExitReason::ReconnectFatal);
        assert(exitCodeFor(reason) == 1);
        assert(sup.diagnostic().find("5 consecutive reconnect failures") != std::string::npos);
        assert(sup.reconnect().isFatal());
        assert(clock.slept() == milliseconds(15000));
    }

    std::cout << "test_pipeline: OK" << std::endl;
    return 0;
}
