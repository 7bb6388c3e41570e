#include "dedup.hpp"
#include "log.hpp"
#include <algorithm>

/**
 * @file dedup.cpp
 * @brief Jaccard matching against the global suppression ring.
 */

namespace vigil {

Deduplicator::Deduplicator(std::chrono::milliseconds window, double overlap,
                           bool refresh_on_suppress)
    : window_(window), overlap_(overlap), refresh_on_suppress_(refresh_on_suppress) {}

LabelSet Deduplicator::labelsOf(const DetectionSet& detections) {
    LabelSet labels;
    for (const auto& d : detections) labels.insert(d.label);
    return labels;
}

std::string Deduplicator::signatureOf(const LabelSet& labels) {
    std::string sig;
    for (const auto& l : labels) {
        if (!sig.empty()) sig += ',';
        sig += l;
    }
    return sig;
}

double Deduplicator::jaccard(const LabelSet& a, const LabelSet& b) {
    if (a.empty() && b.empty()) return 1.0;
    size_t common = 0;
    for (const auto& l : a) {
        if (b.count(l)) ++common;
    }
    const size_t uni = a.size() + b.size() - common;
    return static_cast<double>(common) / static_cast<double>(uni);
}

void Deduplicator::evictExpired(MonoTime now) {
    const auto horizon = window_ * 2;
    history_.erase(std::remove_if(history_.begin(), history_.end(),
                                  [&](const SuppressionEntry& e) { return now - e.last_seen_at > horizon; }),
                   history_.end());
}

bool Deduplicator::shouldEmit(const DetectionSet& detections, MonoTime now) {
    return shouldEmit(labelsOf(detections), now);
}

bool Deduplicator::shouldEmit(const LabelSet& labels, MonoTime now) {
    if (labels.empty()) return false;
    evictExpired(now);

    auto match = history_.end();
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (jaccard(labels, it->labels) >= overlap_) {
            match = std::next(it).base();
            break;
        }
    }

    const std::string sig = signatureOf(labels);
    if (match != history_.end() && now - match->last_seen_at < window_) {
        if (refresh_on_suppress_) match->last_seen_at = now;
        VIGIL_LOG_DEBUG("dedup") << "suppressed [" << sig << "] matching [" << match->signature << "]";
        return false;
    }
    if (match != history_.end()) history_.erase(match);

    history_.push_back(SuppressionEntry{labels, sig, now});
    while (history_.size() > kHistorySize) history_.pop_front();
    return true;
}

} // namespace vigil
