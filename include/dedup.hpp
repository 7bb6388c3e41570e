#ifndef DEDUP_HPP
#define DEDUP_HPP

#include "types.hpp"
#include <chrono>
#include <deque>
#include <set>
#include <string>

namespace vigil {

/**
 * @file dedup.hpp
 * @brief Time-windowed suppression of repeated label sets.
 */

using LabelSet = std::set<std::string>;

/**
 * @brief One remembered label set and when it last produced (or refreshed) an event.
 */
struct SuppressionEntry {
    LabelSet labels;
    std::string signature;   //!< Sorted labels joined with ','.
    MonoTime last_seen_at;
};

/**
 * @brief Decides whether a detection set is new enough to become an event.
 *
 * History is one global ring of the most recent entries, not a per-label
 * table. A candidate matches the newest entry whose Jaccard overlap with it
 * reaches the configured threshold. A match seen within the window is
 * suppressed. Whether a suppressed sighting refreshes the entry is a knob;
 * by default only emitted events move the window.
 * @threading Pipeline consumer thread only.
 */
class Deduplicator {
public:
    static constexpr size_t kHistorySize = 5;

    Deduplicator(std::chrono::milliseconds window, double overlap = 0.80,
                 bool refresh_on_suppress = false);

    /**
     * @brief Record the sighting and report whether it should be emitted.
     * @param now Monotonic sighting time.
     * @return False for empty sets and for matches inside the window.
     */
    bool shouldEmit(const DetectionSet& detections, MonoTime now);

    /** @brief Same decision over an explicit label set. */
    bool shouldEmit(const LabelSet& labels, MonoTime now);

    void setWindow(std::chrono::milliseconds window) { window_ = window; }
    void setOverlap(double overlap) { overlap_ = overlap; }
    void setRefreshOnSuppress(bool refresh) { refresh_on_suppress_ = refresh; }
    std::chrono::milliseconds window() const { return window_; }

    size_t historySize() const { return history_.size(); }
    void clear() { history_.clear(); }

    /** @brief Distinct labels of a detection set. */
    static LabelSet labelsOf(const DetectionSet& detections);
    /** @brief Order-independent signature string for logging. */
    static std::string signatureOf(const LabelSet& labels);
    /** @brief |a ∩ b| / |a ∪ b|; two empty sets score 1. */
    static double jaccard(const LabelSet& a, const LabelSet& b);

private:
    void evictExpired(MonoTime now);

    std::deque<SuppressionEntry> history_; //!< Oldest at front.
    std::chrono::milliseconds window_;
    double overlap_;
    bool refresh_on_suppress_;
};

} // namespace vigil

#endif // DEDUP_HPP
