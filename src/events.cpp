#include "events.hpp"
#include "format.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>

/**
 * @file events.cpp
 * @brief Event ids, JSON/plaintext rendering and sink fan-out.
 */

namespace vigil {

namespace fs = std::filesystem;

EventIdGenerator::EventIdGenerator() : rng_(std::random_device{}()) {}

std::string EventIdGenerator::next(WallTime now) {
    std::lock_guard<std::mutex> lock(mu_);
    int64_t ms = unixMillis(now);
    if (ms < last_ms_) ms = last_ms_;  // Wall clock stepped back
    if (ms != last_ms_) {
        last_ms_ = ms;
        used_.clear();
    }
    if (used_.size() >= 0x10000) {
        // Every suffix of this millisecond is taken
        ++last_ms_;
        ms = last_ms_;
        used_.clear();
    }
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    uint16_t suffix = static_cast<uint16_t>(dist(rng_));
    while (used_.count(suffix)) suffix = static_cast<uint16_t>(dist(rng_));
    used_.insert(suffix);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "evt_%lld_%04x", static_cast<long long>(ms), suffix);
    return buf;
}

std::string generateEventId(WallTime now) {
    static EventIdGenerator gen;
    return gen.next(now);
}

EventPtr makeEvent(Event draft, WallTime created_at) {
    if (draft.event_id.empty()) draft.event_id = generateEventId(created_at);
    draft.created_at = created_at;
    return std::make_shared<const Event>(std::move(draft));
}

static int pct(double v) { return static_cast<int>(v * 100.0); }

std::string eventTitle(const Event& e) {
    if (!e.detections.empty()) {
        auto best = std::max_element(e.detections.begin(), e.detections.end(),
                                     [](const Detection& a, const Detection& b) { return a.confidence < b.confidence; });
        std::string label = best->label;
        if (!label.empty()) label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
        return label + " detected (confidence: " + std::to_string(pct(best->confidence)) + "%)";
    }
    return "Motion detected (confidence: " + std::to_string(pct(e.motion_confidence)) + "%)";
}

std::string eventToJson(const Event& e) {
    std::ostringstream o;
    o << '{'
      << "\"event_id\":\"" << jsonEscape(e.event_id) << "\","
      << "\"timestamp\":\"" << isoTimestamp(e.timestamp) << "\","
      << "\"camera_id\":\"" << jsonEscape(e.camera_id) << "\","
      << "\"frame_id\":" << e.frame_id << ','
      << "\"motion_confidence\":" << std::fixed << std::setprecision(4) << e.motion_confidence << ',';
    o << "\"detected_objects\":[";
    for (size_t i = 0; i < e.detections.size(); ++i) {
        const auto& d = e.detections[i];
        if (i) o << ',';
        o << "{\"label\":\"" << jsonEscape(d.label) << "\","
          << "\"confidence\":" << std::fixed << std::setprecision(4) << d.confidence << ','
          << "\"bbox\":{\"x\":" << d.bbox.x << ",\"y\":" << d.bbox.y
          << ",\"width\":" << d.bbox.width << ",\"height\":" << d.bbox.height << "}}";
    }
    o << "],"
      << "\"description\":\"" << jsonEscape(e.description) << "\","
      << "\"image_path\":\"" << jsonEscape(e.image_path) << "\","
      << "\"created_at\":\"" << isoTimestamp(e.created_at) << "\","
      << "\"timing_ms\":{\"classification\":" << std::fixed << std::setprecision(2) << e.classification_ms
      << ",\"description\":" << std::fixed << std::setprecision(2) << e.description_ms << "}"
      << '}';
    return o.str();
}

DatePartitionedFileSink::DatePartitionedFileSink(std::string root, std::string filename)
    : root_(std::move(root)), filename_(std::move(filename)) {}

bool DatePartitionedFileSink::open() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        VIGIL_LOG_ERROR("events") << name() << ": cannot create " << root_ << ": " << ec.message();
        return false;
    }
    return true;
}

std::string DatePartitionedFileSink::pathFor(const Event& e) const {
    return (fs::path(root_) / utcDate(e.timestamp) / filename_).string();
}

bool DatePartitionedFileSink::ensureStream(const std::string& date) {
    if (ofs_.is_open() && date == current_date_) return true;
    if (ofs_.is_open()) ofs_.close();

    const fs::path dir = fs::path(root_) / date;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        VIGIL_LOG_ERROR("events") << name() << ": cannot create " << dir.string() << ": " << ec.message();
        return false;
    }
    const fs::path file = dir / filename_;
    std::error_code sec;
    const auto existing = fs::exists(file, sec) ? fs::file_size(file, sec) : 0;
    has_content_ = !sec && existing > 0;
    ofs_.open(file, std::ios::out | std::ios::app);
    if (!ofs_.is_open()) {
        VIGIL_LOG_ERROR("events") << name() << ": cannot open " << file.string();
        return false;
    }
    current_date_ = date;
    return true;
}

bool DatePartitionedFileSink::write(const Event& e) {
    const std::string date = utcDate(e.timestamp);
    if (!ensureStream(date)) return false;
    ofs_ << render(e, has_content_);
    ofs_.flush();
    if (!ofs_.good()) {
        VIGIL_LOG_ERROR("events") << name() << ": write failed for " << e.event_id;
        ofs_.close();
        current_date_.clear();
        return false;
    }
    has_content_ = true;
    return true;
}

void DatePartitionedFileSink::flush() {
    if (ofs_.is_open()) ofs_.flush();
}

JsonlEventSink::JsonlEventSink(std::string root)
    : DatePartitionedFileSink(std::move(root), "events.json") {}

std::string JsonlEventSink::render(const Event& e, bool) const {
    return eventToJson(e) + "\n";
}

PlaintextEventSink::PlaintextEventSink(std::string root)
    : DatePartitionedFileSink(std::move(root), "events.log") {}

std::string PlaintextEventSink::render(const Event& e, bool file_has_content) const {
    std::ostringstream o;
    if (file_has_content) o << '\n';
    o << '[' << utcDateTime(e.timestamp) << "] EVENT: " << eventTitle(e) << '\n';
    if (!e.detections.empty()) {
        o << "  - Objects: ";
        for (size_t i = 0; i < e.detections.size(); ++i) {
            if (i) o << ", ";
            o << e.detections[i].label << " (" << pct(e.detections[i].confidence) << "%)";
        }
        o << '\n';
    }
    o << "  - Description: " << e.description << '\n'
      << "  - Image: " << e.image_path << '\n';
    return o.str();
}

EventDispatcher::EventDispatcher(MetricsAggregator* metrics) : metrics_(metrics) {}

void EventDispatcher::addSink(std::unique_ptr<IEventSink> sink) {
    Slot s;
    s.sink = std::move(sink);
    sinks_.push_back(std::move(s));
}

bool EventDispatcher::openAll(std::string& error) {
    if (sinks_.empty()) {
        error = "no event sink configured";
        return false;
    }
    for (size_t i = 0; i < sinks_.size(); ++i) {
        Slot& s = sinks_[i];
        s.usable = s.sink->open();
        if (s.usable) continue;
        if (i == 0) {
            error = "primary event sink '" + s.sink->name() + "' failed to open";
            return false;
        }
        VIGIL_LOG_WARN("events") << "secondary sink '" << s.sink->name() << "' unavailable; continuing without it";
    }
    return true;
}

bool EventDispatcher::dispatch(const Event& e) {
    bool primary_ok = false;
    for (size_t i = 0; i < sinks_.size(); ++i) {
        Slot& s = sinks_[i];
        if (!s.usable) {
            s.usable = s.sink->open();
            if (s.usable) {
                VIGIL_LOG_INFO("events") << "sink '" << s.sink->name() << "' reopened";
            } else {
                if (metrics_) metrics_->sinkFailure();
                VIGIL_LOG_WARN("events") << "sink '" << s.sink->name() << "' still unavailable; skipped "
                                         << e.event_id;
                continue;
            }
        }
        bool ok = false;
        try {
            ok = s.sink->write(e);
        } catch (const std::exception& ex) {
            VIGIL_LOG_ERROR("events") << s.sink->name() << " threw for " << e.event_id << ": " << ex.what();
        }
        if (i == 0) primary_ok = ok;
        if (!ok) {
            if (metrics_) metrics_->sinkFailure();
            VIGIL_LOG_WARN("events") << "sink '" << s.sink->name() << "' failed for " << e.event_id
                                     << (i == 0 ? " (primary)" : "");
        }
    }
    return primary_ok;
}

void EventDispatcher::flushAll() {
    for (auto& s : sinks_) {
        if (s.usable) s.sink->flush();
    }
}

} // namespace vigil
