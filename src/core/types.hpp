#pragma once

#include <atomic>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace tidemark {

/**
 * Timestamp - Milliseconds since the Unix epoch.
 *
 * Stored as INTEGER in SQLite. Ordering is plain integer ordering, which is
 * what LastWriteWins compares.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * ISO 8601 in UTC with millisecond precision, e.g. 2024-01-02T03:04:05.006Z.
     */
    [[nodiscard]] std::string to_iso_string() const {
        const auto secs = static_cast<std::time_t>(millis_ / 1000);
        std::tm utc{};
#ifdef _WIN32
        gmtime_s(&utc, &secs);
#else
        gmtime_r(&secs, &utc);
#endif

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Clock - Source of "now" for anything that schedules retries.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

/**
 * ManualClock - A clock that only moves when told to. Used by tests to step
 * through backoff windows without sleeping. Safe to read from the sync thread
 * while a test advances it.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(1'700'000'000'000)) : now_(start.millis()) {}

    [[nodiscard]] Timestamp now() const override { return Timestamp(now_.load()); }

    void advance(Timestamp::Duration d) { now_ += d.count(); }
    void set(Timestamp t) { now_ = t.millis(); }

private:
    std::atomic<int64_t> now_;
};

} // namespace tidemark
