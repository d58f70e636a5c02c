#pragma once

#include "common/clock.hpp"
#include "common/ids.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace tsync::test {

// ── ManualClock ───────────────────────────────────────────────────────────────
// Clock whose "now" only moves when a test says so.

class ManualClock final : public Clock {
public:
    explicit ManualClock(time_point start = from_unix_seconds(1'700'000'000))
        : now_(start) {}

    [[nodiscard]] time_point now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds by) {
        std::lock_guard lock(mutex_);
        now_ += by;
    }

    void advance_days(int days) { advance(std::chrono::hours(24 * days)); }

private:
    mutable std::mutex mutex_;
    time_point now_;
};

// ── TempDir ───────────────────────────────────────────────────────────────────
// Fresh directory under the system temp dir (random suffix, so parallel test
// processes never collide), removed on destruction.

class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + to_string(new_version_id()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// Deterministic, readable ids: id(1) == 00000000-0000-0000-0000-000000000001.
[[nodiscard]] inline boost::uuids::uuid id(std::uint64_t n) {
    boost::uuids::uuid u{};
    for (int i = 15; i >= 8; --i) {
        u.data[i] = static_cast<std::uint8_t>(n & 0xff);
        n >>= 8;
    }
    return u;
}

} // namespace tsync::test
