#include "sync/snapshot_policy.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>

namespace tsync {

using test::id;

// ── Version-count thresholds ──────────────────────────────────────────────────

TEST(UrgencyForVersions, BelowThresholdIsNone) {
    EXPECT_EQ(urgency_for_versions(0, 100), SnapshotUrgency::none);
    EXPECT_EQ(urgency_for_versions(99, 100), SnapshotUrgency::none);
}

TEST(UrgencyForVersions, AtThresholdIsLow) {
    EXPECT_EQ(urgency_for_versions(100, 100), SnapshotUrgency::low);
    EXPECT_EQ(urgency_for_versions(149, 100), SnapshotUrgency::low);
}

TEST(UrgencyForVersions, OneAndAHalfTimesThresholdIsHigh) {
    EXPECT_EQ(urgency_for_versions(150, 100), SnapshotUrgency::high);
    EXPECT_EQ(urgency_for_versions(10'000, 100), SnapshotUrgency::high);
}

TEST(UrgencyForVersions, LargeThresholdDoesNotOverflow) {
    constexpr auto max = std::numeric_limits<std::uint32_t>::max();
    EXPECT_EQ(urgency_for_versions(max - 1, max), SnapshotUrgency::none);
    EXPECT_EQ(urgency_for_versions(max, max), SnapshotUrgency::low);
}

// ── Age thresholds ────────────────────────────────────────────────────────────

TEST(UrgencyForDays, Thresholds) {
    EXPECT_EQ(urgency_for_days(13, 14), SnapshotUrgency::none);
    EXPECT_EQ(urgency_for_days(14, 14), SnapshotUrgency::low);
    EXPECT_EQ(urgency_for_days(20, 14), SnapshotUrgency::low);
    EXPECT_EQ(urgency_for_days(21, 14), SnapshotUrgency::high);
}

TEST(UrgencyForDays, ZeroDaysAlwaysHigh) {
    EXPECT_EQ(urgency_for_days(0, 0), SnapshotUrgency::high);
}

TEST(UrgencyForDays, OddThresholdRoundsDown) {
    EXPECT_EQ(urgency_for_days(9, 7), SnapshotUrgency::low);
    EXPECT_EQ(urgency_for_days(10, 7), SnapshotUrgency::high);
}

TEST(UrgencyForDays, HugeThresholdDoesNotOverflow) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    EXPECT_EQ(urgency_for_days(0, max), SnapshotUrgency::none);
    EXPECT_EQ(urgency_for_days(max - 1, max), SnapshotUrgency::none);
    EXPECT_EQ(urgency_for_days(max, max), SnapshotUrgency::low);
    EXPECT_EQ(urgency_for_days(max, max / 2), SnapshotUrgency::high);
}

// ── Combined ──────────────────────────────────────────────────────────────────

TEST(CombinedUrgency, NoSnapshotEverIsHigh) {
    const auto now = from_unix_seconds(1'700'000'000);
    EXPECT_EQ(snapshot_urgency(1, std::nullopt, now, 100, 14), SnapshotUrgency::high);
}

TEST(CombinedUrgency, FreshSnapshotFewVersionsIsNone) {
    const auto now = from_unix_seconds(1'700'000'000);
    const SnapshotInfo snap{id(1), now};
    EXPECT_EQ(snapshot_urgency(1, snap, now, 100, 14), SnapshotUrgency::none);
}

TEST(CombinedUrgency, TakesStrongerOfTheTwo) {
    const auto taken = from_unix_seconds(1'700'000'000);
    const SnapshotInfo snap{id(1), taken};

    // Old snapshot, few versions.
    EXPECT_EQ(snapshot_urgency(1, snap, taken + std::chrono::hours(24 * 21), 100, 14),
              SnapshotUrgency::high);
    // Young snapshot, many versions.
    EXPECT_EQ(snapshot_urgency(100, snap, taken + std::chrono::hours(1), 100, 14),
              SnapshotUrgency::low);
    // Both low.
    EXPECT_EQ(snapshot_urgency(100, snap, taken + std::chrono::hours(24 * 14), 100, 14),
              SnapshotUrgency::low);
}

TEST(CombinedUrgency, PartialDaysDoNotCount) {
    const auto taken = from_unix_seconds(1'700'000'000);
    const SnapshotInfo snap{id(1), taken};
    const auto almost = taken + std::chrono::hours(24 * 14) - std::chrono::seconds(1);
    EXPECT_EQ(snapshot_urgency(0, snap, almost, 100, 14), SnapshotUrgency::none);
}

TEST(UrgencyNames, LowerCase) {
    EXPECT_EQ(to_string(SnapshotUrgency::none), "none");
    EXPECT_EQ(to_string(SnapshotUrgency::low), "low");
    EXPECT_EQ(to_string(SnapshotUrgency::high), "high");
}

} // namespace tsync
