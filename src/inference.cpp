#include "inference.hpp"
#include "clock.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <exception>
#include <future>

/**
 * @file inference.cpp
 * @brief Timed collaborator calls, detection filtering and description fallback.
 */

namespace vigil {

const char* outcomeName(TimedInvoker::Outcome outcome) {
    switch (outcome) {
        case TimedInvoker::Outcome::Ok: return "ok";
        case TimedInvoker::Outcome::Failed: return "failed";
        case TimedInvoker::Outcome::TimedOut: return "timed out";
        case TimedInvoker::Outcome::Busy: return "busy";
        case TimedInvoker::Outcome::Cancelled: return "cancelled";
    }
    return "failed";
}

struct TimedInvoker::State {
    std::mutex mu;
    std::condition_variable cv;
    std::function<bool()> pending;
    std::shared_ptr<std::promise<bool>> result;
    bool running = false;
    bool stop = false;
};

TimedInvoker::TimedInvoker(std::string name)
    : state_(std::make_shared<State>()), name_(std::move(name)) {
    std::shared_ptr<State> s = state_;
    worker_ = std::thread([s]() {
        for (;;) {
            std::function<bool()> job;
            std::shared_ptr<std::promise<bool>> result;
            {
                std::unique_lock<std::mutex> lk(s->mu);
                s->cv.wait(lk, [&]{ return s->stop || static_cast<bool>(s->pending); });
                if (s->stop) return;
                job = std::move(s->pending);
                result = std::move(s->result);
                s->pending = nullptr;
                s->running = true;
            }
            bool ok = false;
            std::exception_ptr err;
            try {
                ok = job();
            } catch (...) {
                err = std::current_exception();
            }
            {
                // Free the slot before publishing so the caller can invoke again at once
                std::lock_guard<std::mutex> lk(s->mu);
                s->running = false;
            }
            if (err) {
                result->set_exception(err);
            } else {
                result->set_value(ok);
            }
        }
    });
}

TimedInvoker::~TimedInvoker() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        state_->stop = true;
        state_->pending = nullptr;
        state_->result = nullptr;
        running = state_->running;
    }
    state_->cv.notify_all();
    if (!worker_.joinable()) return;
    if (running) {
        // An abandoned call is still inside the collaborator; the job holds it alive.
        VIGIL_LOG_WARN("inference") << name_ << ": detaching worker with call in progress";
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool TimedInvoker::busy() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->running || static_cast<bool>(state_->pending);
}

TimedInvoker::Outcome TimedInvoker::invoke(std::function<bool()> job, std::chrono::milliseconds timeout,
                                           const std::function<bool()>& abort,
                                           std::chrono::milliseconds poll) {
    auto result = std::make_shared<std::promise<bool>>();
    std::future<bool> fut = result->get_future();
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        if (state_->running || state_->pending) return Outcome::Busy;
        state_->pending = std::move(job);
        state_->result = result;
    }
    state_->cv.notify_one();

    const auto slice_max = std::max(std::chrono::milliseconds(1), poll);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return Outcome::TimedOut;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto slice = std::min(slice_max, std::max(std::chrono::milliseconds(1), left));
        if (fut.wait_for(slice) == std::future_status::ready) {
            try {
                return fut.get() ? Outcome::Ok : Outcome::Failed;
            } catch (const std::exception& ex) {
                VIGIL_LOG_WARN("inference") << name_ << " threw: " << ex.what();
                return Outcome::Failed;
            }
        }
        if (abort && abort()) return Outcome::Cancelled;
    }
}

InferenceStage::InferenceStage(std::shared_ptr<IClassifier> classifier, std::shared_ptr<IDescriber> describer,
                               InferenceOptions options, MetricsAggregator& metrics)
    : classifier_(std::move(classifier)),
      describer_(std::move(describer)),
      classifier_enabled_(classifier_ != nullptr),
      describer_enabled_(describer_ != nullptr),
      options_(std::move(options)),
      metrics_(metrics) {
    if (classifier_) classify_worker_ = std::make_unique<TimedInvoker>("classifier:" + classifier_->name());
    if (describer_) describe_worker_ = std::make_unique<TimedInvoker>("describer:" + describer_->name());
}

bool InferenceStage::healthCheck() {
    const auto probe_timeout = std::max(options_.classification_timeout, options_.description_timeout);
    if (classifier_) {
        std::shared_ptr<IClassifier> c = classifier_;
        auto r = classify_worker_->invoke([c]() { return c->healthCheck(); }, probe_timeout, abort_,
                                          options_.poll_interval);
        classifier_enabled_ = r == TimedInvoker::Outcome::Ok;
        if (classifier_enabled_) {
            VIGIL_LOG_INFO("inference") << "classifier " << c->name() << " ready";
        } else {
            VIGIL_LOG_WARN("inference") << "classifier " << c->name() << " unavailable (" << outcomeName(r)
                                        << "); running motion-only";
        }
    } else {
        VIGIL_LOG_INFO("inference") << "no classifier configured; running motion-only";
    }
    if (describer_) {
        std::shared_ptr<IDescriber> d = describer_;
        auto r = describe_worker_->invoke([d]() { return d->healthCheck(); }, probe_timeout, abort_,
                                          options_.poll_interval);
        describer_enabled_ = r == TimedInvoker::Outcome::Ok;
        if (describer_enabled_) {
            VIGIL_LOG_INFO("inference") << "describer " << d->name() << " ready";
        } else {
            VIGIL_LOG_WARN("inference") << "describer " << d->name() << " unavailable (" << outcomeName(r)
                                        << "); using label fallback";
        }
    }
    return true;
}

Detection InferenceStage::motionDetection(const Frame& frame, const MotionResult& motion) {
    Detection d;
    d.label = "motion";
    d.confidence = static_cast<float>(motion.confidence);
    d.bbox = BoundingBox{0, 0, frame.image.cols, frame.image.rows};
    return d;
}

DetectionSet InferenceStage::filter(const DetectionSet& detections) const {
    DetectionSet kept;
    for (const auto& d : detections) {
        if (std::find(options_.blacklist.begin(), options_.blacklist.end(), d.label) != options_.blacklist.end()) {
            continue;
        }
        if (d.confidence < options_.min_confidence) continue;
        kept.push_back(d);
    }
    return kept;
}

bool InferenceStage::detect(const Frame& frame, const MotionResult& motion, DetectionSet& out, double& elapsed_ms) {
    out.clear();
    elapsed_ms = 0.0;
    if (!classifier_enabled_) {
        out.push_back(motionDetection(frame, motion));
        return true;
    }

    auto result = std::make_shared<DetectionSet>();
    std::shared_ptr<IClassifier> c = classifier_;
    Frame shared = frame;  // cv::Mat header copy; pixels stay shared
    const auto start = std::chrono::steady_clock::now();
    auto r = classify_worker_->invoke([c, shared, result]() { return c->classify(shared, *result); },
                                      options_.classification_timeout, abort_, options_.poll_interval);
    elapsed_ms = elapsedMs(start, std::chrono::steady_clock::now());
    if (r != TimedInvoker::Outcome::Ok) {
        VIGIL_LOG_WARN("inference") << "classification " << outcomeName(r) << " for frame "
                                    << frame.frame_id << " after " << static_cast<int>(elapsed_ms) << "ms; skipping";
        return false;
    }
    metrics_.recordClassification(elapsed_ms);
    out = filter(*result);
    VIGIL_LOG_DEBUG("inference") << "frame " << frame.frame_id << ": " << result->size()
                                 << " detections, " << out.size() << " after filtering";
    return true;
}

std::string InferenceStage::fallbackDescription(const DetectionSet& detections) {
    std::string text = "Detected: ";
    for (size_t i = 0; i < detections.size(); ++i) {
        if (i) text += ", ";
        text += detections[i].label;
    }
    return text;
}

std::string InferenceStage::describe(const Frame& frame, const DetectionSet& detections, double& elapsed_ms) {
    elapsed_ms = 0.0;
    if (!describer_enabled_) return fallbackDescription(detections);

    auto text = std::make_shared<std::string>();
    std::shared_ptr<IDescriber> d = describer_;
    Frame shared = frame;
    DetectionSet dets = detections;
    const auto start = std::chrono::steady_clock::now();
    auto r = describe_worker_->invoke([d, shared, dets, text]() { return d->describe(shared, dets, *text); },
                                      options_.description_timeout, abort_, options_.poll_interval);
    elapsed_ms = elapsedMs(start, std::chrono::steady_clock::now());
    if (r != TimedInvoker::Outcome::Ok || text->empty()) {
        VIGIL_LOG_WARN("inference") << "description " << outcomeName(r) << " for frame " << frame.frame_id
                                    << "; using fallback";
        return fallbackDescription(detections);
    }
    metrics_.recordDescription(elapsed_ms);
    return *text;
}

} // namespace vigil
