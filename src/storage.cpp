#include "storage.hpp"
#include "format.hpp"
#include "log.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

/**
 * @file storage.cpp
 * @brief Usage walk, threshold classification and partition rotation.
 */

namespace vigil {

namespace fs = std::filesystem;

static double to_mb(uint64_t bytes) { return bytes / (1024.0 * 1024.0); }

const char* storageLevelName(StorageLevel level) {
    switch (level) {
        case StorageLevel::Ok: return "ok";
        case StorageLevel::Warning: return "warning";
        case StorageLevel::Critical: return "critical";
    }
    return "ok";
}

uint64_t directorySize(const std::string& path) {
    uint64_t total = 0;
    std::error_code ec;
    if (!fs::exists(path, ec)) return 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        VIGIL_LOG_WARN("storage") << "cannot scan " << path << ": " << ec.message();
        return 0;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            VIGIL_LOG_WARN("storage") << "scan error under " << path << ": " << ec.message();
            ec.clear();
            continue;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        const auto sz = it->file_size(fec);
        if (fec) {
            VIGIL_LOG_WARN("storage") << "cannot stat " << it->path().string() << ": " << fec.message();
            continue;
        }
        total += sz;
    }
    return total;
}

// Howard Hinnant's days_from_civil.
int64_t daysFromCivil(int year, int month, int day) {
    year -= month <= 2;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

RotationPolicy::RotationPolicy(std::string root, int min_retention_days, IClock& clock)
    : root_(std::move(root)), min_retention_days_(min_retention_days), clock_(clock) {}

int64_t RotationPolicy::today() const {
    int y = 0, m = 0, d = 0;
    parsePartitionDate(utcDate(clock_.wallNow()), y, m, d);
    return daysFromCivil(y, m, d);
}

std::vector<Partition> RotationPolicy::listPartitions() const {
    std::vector<Partition> parts;
    std::error_code ec;
    if (!fs::exists(root_, ec)) return parts;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        VIGIL_LOG_ERROR("storage") << "failed to scan " << root_ << ": " << ec.message();
        return parts;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code dec;
        if (!it->is_directory(dec)) continue;
        const std::string name = it->path().filename().string();
        int y = 0, m = 0, d = 0;
        if (!parsePartitionDate(name, y, m, d)) continue;
        Partition p;
        p.path = it->path().string();
        p.name = name;
        p.day = daysFromCivil(y, m, d);
        p.bytes = directorySize(p.path);
        parts.push_back(std::move(p));
    }
    std::sort(parts.begin(), parts.end(),
              [](const Partition& a, const Partition& b) { return a.day < b.day; });
    return parts;
}

bool RotationPolicy::deletable(const Partition& p, int64_t today, size_t remaining) const {
    if (p.day >= today) return false;
    if (p.day >= today - min_retention_days_) return false;
    return remaining > static_cast<size_t>(min_retention_days_);
}

int RotationPolicy::countDeletable(const std::vector<Partition>& parts) const {
    const int64_t t = today();
    size_t remaining = parts.size();
    int n = 0;
    for (const auto& p : parts) {
        if (deletable(p, t, remaining)) { ++n; --remaining; }
    }
    return n;
}

RotationResult RotationPolicy::rotate(uint64_t current_bytes, uint64_t target_bytes, bool force) {
    RotationResult r;
    const auto parts = listPartitions();
    const int64_t t = today();
    size_t remaining = parts.size();

    r.partitions_deletable = countDeletable(parts);

    uint64_t usage = current_bytes;
    VIGIL_LOG_WARN("storage") << "rotation start: usage=" << std::fixed << std::setprecision(1)
                              << to_mb(usage) << "MB target=" << to_mb(target_bytes)
                              << "MB partitions=" << parts.size()
                              << " eligible=" << r.partitions_deletable
                              << (force ? " (forced)" : "");

    for (const auto& p : parts) {
        const bool must_delete = force && r.partitions_deleted == 0;
        if (!must_delete && usage < target_bytes) break;
        if (!deletable(p, t, remaining)) continue;

        std::error_code ec;
        fs::remove_all(p.path, ec);
        if (ec) {
            VIGIL_LOG_ERROR("storage") << "failed to delete partition " << p.name << ": " << ec.message();
            continue;
        }
        usage -= std::min(usage, p.bytes);
        r.bytes_freed += p.bytes;
        ++r.partitions_deleted;
        --remaining;
        VIGIL_LOG_WARN("storage") << "deleted partition " << p.name << " freed="
                                  << std::fixed << std::setprecision(1) << to_mb(p.bytes) << "MB";
    }

    r.partitions_remaining = static_cast<int>(remaining);
    r.floor_binding = usage >= target_bytes;
    if (r.partitions_deleted > 0) {
        VIGIL_LOG_WARN("storage") << "rotation done: deleted=" << r.partitions_deleted
                                  << " freed=" << std::fixed << std::setprecision(1)
                                  << to_mb(r.bytes_freed) << "MB usage=" << to_mb(usage) << "MB";
    } else {
        VIGIL_LOG_INFO("storage") << "no partitions available for rotation";
    }
    return r;
}

StorageGovernor::StorageGovernor(std::string root, uint64_t max_bytes, int min_retention_days,
                                 int check_interval, IClock& clock)
    : root_(root),
      max_bytes_(max_bytes),
      check_interval_(check_interval < 1 ? 1 : check_interval),
      rotation_(std::move(root), min_retention_days, clock) {
    status_.min_retention_days = min_retention_days;
}

StorageSnapshot StorageGovernor::snapshotFor(uint64_t bytes) const {
    StorageSnapshot s;
    s.total_bytes = bytes;
    s.limit_bytes = max_bytes_;
    s.percent_used = max_bytes_ > 0 ? (double)bytes * 100.0 / (double)max_bytes_ : 100.0;
    s.is_over_limit = bytes >= max_bytes_;
    return s;
}

StorageSnapshot StorageGovernor::checkUsage() const {
    return snapshotFor(directorySize(root_));
}

void StorageGovernor::setLimits(uint64_t max_bytes, int min_retention_days, int check_interval) {
    max_bytes_ = max_bytes;
    check_interval_ = check_interval < 1 ? 1 : check_interval;
    rotation_.setMinRetentionDays(min_retention_days);
    status_.min_retention_days = min_retention_days;
}

StorageLevel StorageGovernor::onEventEmitted() {
    if (++events_since_check_ < static_cast<uint64_t>(check_interval_)) {
        return StorageLevel::Ok;
    }
    events_since_check_ = 0;
    return evaluate();
}

StorageLevel StorageGovernor::evaluate() {
    StorageSnapshot snap = checkUsage();
    const uint64_t target = static_cast<uint64_t>(max_bytes_ * kTargetRatio);
    bool floor_binding = false;

    if ((double)snap.total_bytes > max_bytes_ * kRotateRatio) {
        RotationResult r = rotation_.rotate(snap.total_bytes, target);
        floor_binding = r.floor_binding;
        snap = checkUsage();
    }

    const auto parts = rotation_.listPartitions();
    status_.snapshot = snap;
    status_.partitions_total = static_cast<int>(parts.size());
    status_.partitions_deletable = rotation_.countDeletable(parts);
    status_.min_retention_days = rotation_.minRetentionDays();
    status_.floor_binding = floor_binding;
    status_.ceiling_exceeded = snap.is_over_limit;
    status_.conflict = floor_binding && snap.total_bytes > target;

    if (status_.conflict) {
        VIGIL_LOG_WARN("storage") << "RETENTION CONFLICT: floor of " << status_.min_retention_days
                                  << " days keeps usage at " << std::fixed << std::setprecision(1)
                                  << snap.percent_used << "% of limit (target "
                                  << kTargetRatio * 100.0 << "%), " << status_.partitions_total
                                  << " partitions retained";
    }

    if (snap.is_over_limit) {
        std::ostringstream oss;
        oss << "storage ceiling exceeded: " << std::fixed << std::setprecision(1)
            << to_mb(snap.total_bytes) << "MB of " << to_mb(snap.limit_bytes) << "MB ("
            << snap.percent_used << "%)";
        if (status_.conflict) {
            oss << "; retention floor of " << status_.min_retention_days << " days blocks rotation";
        }
        diagnostic_ = oss.str();
        VIGIL_LOG_ERROR("storage") << diagnostic_;
        return StorageLevel::Critical;
    }
    if ((double)snap.total_bytes >= max_bytes_ * kWarnRatio) {
        VIGIL_LOG_WARN("storage") << "usage at " << std::fixed << std::setprecision(1)
                                  << snap.percent_used << "% of limit";
        return StorageLevel::Warning;
    }
    VIGIL_LOG_DEBUG("storage") << "usage at " << std::fixed << std::setprecision(1)
                               << snap.percent_used << "% of limit";
    return StorageLevel::Ok;
}

} // namespace vigil
