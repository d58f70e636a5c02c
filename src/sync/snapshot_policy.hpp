#pragma once

#include "common/clock.hpp"
#include "storage/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace tsync {

// How strongly the server asks a replica to upload a snapshot.  Ordered, so
// std::max picks the stronger request.
enum class SnapshotUrgency : std::uint8_t { none = 0, low = 1, high = 2 };

// "low" / "high"; "none" for SnapshotUrgency::none.
[[nodiscard]] std::string_view to_string(SnapshotUrgency urgency) noexcept;

// ── Thresholds ────────────────────────────────────────────────────────────────
//
// For a threshold t: value >= t * 3 / 2 is high, value >= t is low.

[[nodiscard]] SnapshotUrgency urgency_for_versions(std::uint32_t versions_since_snapshot,
                                                   std::uint32_t snapshot_versions) noexcept;

[[nodiscard]] SnapshotUrgency urgency_for_days(std::int64_t days_since_snapshot,
                                               std::int64_t snapshot_days) noexcept;

// Combined urgency after a committed version: high when no snapshot was ever
// stored, otherwise the stronger of the version-count and age urgencies.
[[nodiscard]] SnapshotUrgency
snapshot_urgency(std::uint32_t versions_since_snapshot,
                 const std::optional<SnapshotInfo>& snapshot,
                 Clock::time_point now,
                 std::uint32_t snapshot_versions,
                 std::int64_t snapshot_days) noexcept;

} // namespace tsync
