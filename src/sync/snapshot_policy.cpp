#include "sync/snapshot_policy.hpp"

#include <algorithm>
#include <chrono>

namespace tsync {

std::string_view to_string(SnapshotUrgency urgency) noexcept {
    switch (urgency) {
    case SnapshotUrgency::low:  return "low";
    case SnapshotUrgency::high: return "high";
    case SnapshotUrgency::none: break;
    }
    return "none";
}

SnapshotUrgency urgency_for_versions(std::uint32_t versions_since_snapshot,
                                     std::uint32_t snapshot_versions) noexcept {
    // 64-bit so the 3/2 threshold cannot overflow.
    const std::uint64_t n = versions_since_snapshot;
    const std::uint64_t t = snapshot_versions;
    if (n >= t * 3 / 2) return SnapshotUrgency::high;
    if (n >= t)         return SnapshotUrgency::low;
    return SnapshotUrgency::none;
}

SnapshotUrgency urgency_for_days(std::int64_t days_since_snapshot,
                                 std::int64_t snapshot_days) noexcept {
    // Past the threshold both sides are non-negative, so the difference cannot
    // overflow, and d + d/2 == d*3/2 without computing d*3.
    const std::int64_t t = std::max<std::int64_t>(snapshot_days, 0);
    if (days_since_snapshot < t)               return SnapshotUrgency::none;
    if (days_since_snapshot - t >= t / 2)      return SnapshotUrgency::high;
    return SnapshotUrgency::low;
}

SnapshotUrgency snapshot_urgency(std::uint32_t versions_since_snapshot,
                                 const std::optional<SnapshotInfo>& snapshot,
                                 Clock::time_point now,
                                 std::uint32_t snapshot_versions,
                                 std::int64_t snapshot_days) noexcept {
    if (!snapshot) {
        return SnapshotUrgency::high;
    }

    using days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
    const auto age = std::chrono::duration_cast<days>(now - snapshot->timestamp).count();

    return std::max(urgency_for_versions(versions_since_snapshot, snapshot_versions),
                    urgency_for_days(age, snapshot_days));
}

} // namespace tsync
