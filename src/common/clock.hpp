#pragma once

#include <chrono>
#include <cstdint>

namespace tsync {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for snapshot timestamps and snapshot-age checks, so
// tests can pin "now" instead of sleeping for days.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }

    // Shared process-wide instance for components constructed without an
    // explicit clock.
    [[nodiscard]] static const SystemClock& instance() {
        static const SystemClock clock;
        return clock;
    }
};

// Whole seconds since the Unix epoch; the persisted timestamp resolution.
[[nodiscard]] inline int64_t to_unix_seconds(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
}

[[nodiscard]] inline Clock::time_point from_unix_seconds(int64_t secs) {
    return Clock::time_point{std::chrono::seconds{secs}};
}

} // namespace tsync
