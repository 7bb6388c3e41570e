#ifndef STORAGE_HPP
#define STORAGE_HPP

#include "clock.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

/**
 * @file storage.hpp
 * @brief Disk usage governor and FIFO rotation of date partitions.
 *
 * Event data lives under `<root>/YYYY-MM-DD/`. The governor measures the
 * whole tree every N emitted events, rotates the oldest partitions once usage
 * passes 90% of the limit and escalates to a shutdown request at 100%.
 * Rotation never removes today's partition and never goes below the retention
 * floor; when the floor blocks the rotation target, the conflict is logged
 * and reported through RetentionStatus.
 */

/**
 * @brief Severity of the most recent usage check.
 */
enum class StorageLevel {
    Ok,
    Warning,   //!< At or above 80% of the limit.
    Critical   //!< At or above 100%; the pipeline must shut down.
};

const char* storageLevelName(StorageLevel level);

/**
 * @brief One date-named directory under the event root.
 */
struct Partition {
    std::string path;
    std::string name;       //!< YYYY-MM-DD.
    int64_t day = 0;        //!< Days since 1970-01-01.
    uint64_t bytes = 0;
};

/**
 * @brief Outcome of a rotation pass.
 */
struct RotationResult {
    uint64_t bytes_freed = 0;
    int partitions_deleted = 0;
    int partitions_remaining = 0;
    int partitions_deletable = 0;
    bool floor_binding = false;  //!< Stopped above target because of the floor or today.
};

/** @brief Recursive size of regular files; unreadable entries are skipped. */
uint64_t directorySize(const std::string& path);

/** @brief Days since the Unix epoch for a civil UTC date. */
int64_t daysFromCivil(int year, int month, int day);

/**
 * @brief Oldest-first deletion of whole date partitions.
 * @threading Pipeline consumer thread only.
 */
class RotationPolicy {
public:
    RotationPolicy(std::string root, int min_retention_days, IClock& clock);

    /** @brief Date partitions under the root, oldest first. */
    std::vector<Partition> listPartitions() const;

    /**
     * @brief Whether a partition may be deleted while @p remaining partitions exist.
     *
     * Today's partition is never deletable. A partition inside the retention
     * window (younger than min_retention_days) is never deletable, and a
     * deletion may not leave fewer than min_retention_days partitions.
     */
    bool deletable(const Partition& p, int64_t today, size_t remaining) const;

    /** @brief How many of @p parts rotation could remove right now. */
    int countDeletable(const std::vector<Partition>& parts) const;

    /**
     * @brief Delete oldest partitions until usage is at or below @p target_bytes.
     * @param current_bytes Usage measured before rotating.
     * @param force Delete at least one eligible partition even when under target.
     */
    RotationResult rotate(uint64_t current_bytes, uint64_t target_bytes, bool force = false);

    void setMinRetentionDays(int days) { min_retention_days_ = days; }
    int minRetentionDays() const { return min_retention_days_; }

private:
    int64_t today() const;

    std::string root_;
    int min_retention_days_;
    IClock& clock_;
};

/**
 * @brief Periodic usage measurement with warning, rotation and critical thresholds.
 * @threading Pipeline consumer thread only.
 * @ownership Owns its RotationPolicy.
 */
class StorageGovernor {
public:
    static constexpr double kWarnRatio = 0.80;
    static constexpr double kRotateRatio = 0.90;
    static constexpr double kTargetRatio = 0.80;

    StorageGovernor(std::string root, uint64_t max_bytes, int min_retention_days,
                    int check_interval, IClock& clock);

    /** @brief Walk the root and report current usage. */
    StorageSnapshot checkUsage() const;

    /**
     * @brief Count one emitted event; every check_interval events run evaluate().
     * @return Level of the latest evaluation (Ok between checks).
     */
    StorageLevel onEventEmitted();

    /**
     * @brief Measure, rotate when above 90%, re-measure and classify.
     */
    StorageLevel evaluate();

    /** @brief Ceiling and floor state as of the last evaluate(). */
    const RetentionStatus& status() const { return status_; }

    /** @brief One-line reason for the last Critical result. */
    const std::string& diagnostic() const { return diagnostic_; }

    RotationPolicy& rotation() { return rotation_; }

    void setLimits(uint64_t max_bytes, int min_retention_days, int check_interval);
    uint64_t maxBytes() const { return max_bytes_; }
    const std::string& root() const { return root_; }

private:
    StorageSnapshot snapshotFor(uint64_t bytes) const;

    std::string root_;
    uint64_t max_bytes_;
    int check_interval_;
    uint64_t events_since_check_ = 0;
    RotationPolicy rotation_;
    RetentionStatus status_;
    std::string diagnostic_;
};

} // namespace vigil

#endif // STORAGE_HPP
