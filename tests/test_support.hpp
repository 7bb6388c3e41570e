#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "capture.hpp"
#include "clock.hpp"
#include "events.hpp"
#include "inference.hpp"
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace vigil {
namespace testing {

/**
 * @brief Clock that only moves when told to; sleepFor() advances it instantly.
 */
class ManualClock : public IClock {
public:
    ManualClock()
        : mono_(MonoTime(std::chrono::hours(1))),
          wall_(WallTime(std::chrono::seconds(1760000000))) {}

    MonoTime now() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return mono_;
    }
    WallTime wallNow() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return wall_;
    }
    void sleepFor(std::chrono::milliseconds d) override {
        std::lock_guard<std::mutex> lk(mu_);
        mono_ += d;
        wall_ += d;
        slept_ += d;
    }

    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mu_);
        mono_ += d;
        wall_ += d;
    }
    void setWall(WallTime t) {
        std::lock_guard<std::mutex> lk(mu_);
        wall_ = t;
    }
    std::chrono::milliseconds slept() const {
        std::lock_guard<std::mutex> lk(mu_);
        return slept_;
    }

private:
    mutable std::mutex mu_;
    MonoTime mono_;
    WallTime wall_;
    std::chrono::milliseconds slept_{0};
};

/** @brief Solid grey frame with an optional white block covering @p block_fraction of the width. */
inline Frame makeFrame(uint64_t id, double block_fraction = 0.0, int width = 64, int height = 48) {
    Frame f;
    f.frame_id = id;
    f.image = cv::Mat(height, width, CV_8UC3, cv::Scalar(40, 40, 40));
    if (block_fraction > 0.0) {
        const int w = static_cast<int>(width * block_fraction);
        cv::rectangle(f.image, cv::Rect(0, 0, w, height), cv::Scalar(255, 255, 255), -1);
    }
    f.capture_time = std::chrono::system_clock::now();
    f.mono_time = std::chrono::steady_clock::now();
    return f;
}

/**
 * @brief Scripted frame source. Connect results and read statuses are consumed in order;
 *        once a script runs out the last entry repeats.
 */
class FakeFrameSource : public IFrameSource {
public:
    std::deque<bool> connect_script{true};
    std::deque<ReadStatus> read_script{ReadStatus::Frame};
    std::chrono::milliseconds read_delay{0};

    bool connect() override {
        ++connects;
        return next(connect_script);
    }
    ReadStatus read(Frame& frame, std::chrono::milliseconds) override {
        if (read_delay.count() > 0) std::this_thread::sleep_for(read_delay);
        const ReadStatus st = next(read_script);
        if (st == ReadStatus::Frame) {
            frame = makeFrame(++frames_out, 0.5);
        }
        return st;
    }
    void close() override { ++closes; }
    std::string describe() const override { return "fake://camera"; }

    std::atomic<int> connects{0};
    std::atomic<int> closes{0};
    std::atomic<uint64_t> frames_out{0};

private:
    template <typename T>
    static T next(std::deque<T>& script) {
        T v = script.front();
        if (script.size() > 1) script.pop_front();
        return v;
    }
};

class FakeClassifier : public IClassifier {
public:
    DetectionSet result;
    bool ok = true;
    bool healthy = true;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};

    bool classify(const Frame&, DetectionSet& out) override {
        ++calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        out = result;
        return ok;
    }
    bool healthCheck() override { return healthy; }
    std::string name() const override { return "fake-classifier"; }
};

class FakeDescriber : public IDescriber {
public:
    std::string text = "A person walks across the driveway.";
    bool ok = true;
    bool healthy = true;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};

    bool describe(const Frame&, const DetectionSet&, std::string& out) override {
        ++calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        out = text;
        return ok;
    }
    bool healthCheck() override { return healthy; }
    std::string name() const override { return "fake-describer"; }
};

/**
 * @brief Event sink that keeps copies in memory; can be told to fail opens or writes.
 */
class MemorySink : public IEventSink {
public:
    explicit MemorySink(std::string name = "memory") : name_(std::move(name)) {}

    bool open_ok = true;
    bool write_ok = true;
    std::vector<Event> events;
    int flushes = 0;
    int opens = 0;

    bool open() override {
        ++opens;
        return open_ok;
    }
    bool write(const Event& e) override {
        if (!write_ok) return false;
        events.push_back(e);
        return true;
    }
    void flush() override { ++flushes; }
    std::string name() const override { return name_; }

private:
    std::string name_;
};

/** @brief Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        path_ = (std::filesystem::temp_directory_path() /
                 ("vigil_" + tag + "_" + std::to_string(::getpid()))).string();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::string& path() const { return path_; }
    std::string sub(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }

private:
    std::string path_;
};

inline Detection makeDetection(const std::string& label, float confidence) {
    Detection d;
    d.label = label;
    d.confidence = confidence;
    d.bbox = BoundingBox{4, 4, 20, 20};
    return d;
}

} // namespace testing
} // namespace vigil

#endif // TEST_SUPPORT_HPP
