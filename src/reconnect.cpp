#include "reconnect.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include <algorithm>

/**
 * @file reconnect.cpp
 * @brief Backoff state machine and the acquisition loop body.
 */

namespace vigil {

const char* linkStateName(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "Disconnected";
        case LinkState::Connecting: return "Connecting";
        case LinkState::Connected: return "Connected";
        case LinkState::Fatal: return "Fatal";
    }
    return "Disconnected";
}

ReconnectPolicy ReconnectPolicy::fromConfig(const PipelineConfig& config) {
    ReconnectPolicy p;
    p.initial_backoff = std::chrono::milliseconds(config.backoff_initial_ms);
    p.max_backoff = std::chrono::milliseconds(config.backoff_max_ms);
    p.max_failures = config.max_reconnect_failures;
    p.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
    p.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    p.fatal_policy = config.fatal_policy;
    return p;
}

ReconnectSupervisor::ReconnectSupervisor(IFrameSource& source, ReconnectPolicy policy, IClock& clock,
                                         MetricsAggregator* metrics)
    : source_(source), clock_(clock), metrics_(metrics), policy_(policy) {}

void ReconnectSupervisor::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(state_mu_);
    listener_ = std::move(listener);
}

void ReconnectSupervisor::transitionLocked(LinkState to) {
    const LinkState from = state_;
    if (from == to) return;
    state_ = to;
    if (to == LinkState::Fatal || to == LinkState::Disconnected) {
        VIGIL_LOG_WARN("reconnect") << linkStateName(from) << " -> " << linkStateName(to)
                                    << " (failures=" << failures_ << ")";
    } else {
        VIGIL_LOG_INFO("reconnect") << linkStateName(from) << " -> " << linkStateName(to)
                                    << " (failures=" << failures_ << ")";
    }
    if (listener_) listener_(from, to, failures_);
}

std::chrono::milliseconds ReconnectSupervisor::backoffFor(int step, const ReconnectPolicy& policy) {
    if (step < 1) step = 1;
    auto delay = policy.initial_backoff;
    for (int i = 1; i < step && delay < policy.max_backoff; ++i) delay *= 2;
    return std::min(delay, policy.max_backoff);
}

std::chrono::milliseconds ReconnectSupervisor::currentBackoff() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return backoffFor(backoff_step_, policy_);
}

bool ReconnectSupervisor::reconnect() {
    std::unique_lock<std::mutex> attempt(connect_mu_, std::try_to_lock);
    if (!attempt.owns_lock()) {
        VIGIL_LOG_DEBUG("reconnect") << "attempt already in progress";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (state_ == LinkState::Connected) return true;
        transitionLocked(LinkState::Connecting);
    }
    if (metrics_) metrics_->reconnectAttempt();

    bool ok = false;
    try {
        ok = source_.connect();
    } catch (const std::exception& ex) {
        VIGIL_LOG_ERROR("reconnect") << "connect threw: " << ex.what();
    }
    if (!ok) {
        reportFailure("connect to " + source_.describe() + " failed");
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mu_);
    backoff_step_ = 0;
    transitionLocked(LinkState::Connected);
    return true;
}

void ReconnectSupervisor::reportFailure(const std::string& reason) {
    source_.close();
    std::lock_guard<std::mutex> lock(state_mu_);
    ++failures_;
    ++backoff_step_;
    VIGIL_LOG_WARN("reconnect") << reason << " (consecutive failures " << failures_
                                << "/" << policy_.max_failures << ")";
    if (failures_ >= policy_.max_failures) {
        transitionLocked(LinkState::Fatal);
    } else {
        transitionLocked(LinkState::Disconnected);
    }
}

void ReconnectSupervisor::reportFrame() {
    std::lock_guard<std::mutex> lock(state_mu_);
    failures_ = 0;
}

LinkState ReconnectSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
}

int ReconnectSupervisor::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return failures_;
}

void ReconnectSupervisor::setPolicy(const ReconnectPolicy& policy) {
    std::lock_guard<std::mutex> lock(state_mu_);
    policy_ = policy;
}

ReconnectPolicy ReconnectSupervisor::policy() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return policy_;
}

bool ReconnectSupervisor::sleepInterruptible(std::chrono::milliseconds d, const std::atomic<bool>& stop) {
    const auto slice = std::max(std::chrono::milliseconds(1), policy().poll_interval);
    auto remaining = d;
    while (remaining.count() > 0) {
        if (stop.load()) return false;
        const auto step = std::min(slice, remaining);
        clock_.sleepFor(step);
        remaining -= step;
    }
    return !stop.load();
}

void ReconnectSupervisor::run(BoundedFrameQueue& queue, const std::atomic<bool>& stop) {
    VIGIL_LOG_INFO("reconnect") << "acquisition started for " << source_.describe();
    while (!stop.load()) {
        const LinkState s = state();
        if (s == LinkState::Fatal && policy().fatal_policy == FatalPolicy::Exit) {
            break;
        }
        if (s != LinkState::Connected) {
            if (!reconnect()) {
                if (isFatal() && policy().fatal_policy == FatalPolicy::Exit) break;
                sleepInterruptible(currentBackoff(), stop);
            }
            continue;
        }

        Frame frame;
        ReadStatus st = ReadStatus::Closed;
        try {
            st = source_.read(frame, policy().read_timeout);
        } catch (const std::exception& ex) {
            VIGIL_LOG_ERROR("reconnect") << "read threw: " << ex.what();
        }
        if (st == ReadStatus::Frame) {
            reportFrame();
            queue.push(std::move(frame));
            continue;
        }
        reportFailure(st == ReadStatus::Timeout ? "read timed out" : "stream closed");
        if (isFatal() && policy().fatal_policy == FatalPolicy::Exit) break;
        sleepInterruptible(currentBackoff(), stop);
    }
    source_.close();
    VIGIL_LOG_INFO("reconnect") << "acquisition stopped (state=" << linkStateName(state()) << ")";
}

} // namespace vigil
