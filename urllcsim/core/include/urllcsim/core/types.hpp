#pragma once

#include <compare>
#include <cstdint>

namespace urllcsim::core {

/// @brief Simulated interval stored as a signed nanosecond count.
///
/// Configuration and radio formulas work in seconds (double); the event
/// queue works in integer nanoseconds so that equal instants compare equal
/// and runs are reproducible. The constructor is private: every Duration is
/// built through one of the bridge functions below, which makes each
/// seconds/nanoseconds conversion visible at the call site.
///
/// @see duration_from_seconds, duration_from_seconds_ceil, TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    static constexpr int64_t nearest_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    // Airtimes are rounded up so a completion never fires before the last bit.
    static constexpr int64_t ceil_ns(double s) noexcept {
        double exact = s * 1e9;
        auto truncated = static_cast<int64_t>(exact);
        if (static_cast<double>(truncated) < exact) {
            ++truncated;
        }
        return truncated;
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_seconds_ceil(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Zero-length interval.
    constexpr Duration() noexcept : ns_(0) {}

    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Interval in seconds.
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept { return ns_; }

    constexpr Duration operator+(Duration rhs) const noexcept { return Duration{ns_ + rhs.ns_}; }
    constexpr Duration operator-(Duration rhs) const noexcept { return Duration{ns_ - rhs.ns_}; }
    constexpr Duration operator-() const noexcept { return Duration{-ns_}; }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ -= rhs.ns_;
        return *this;
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulated instant, measured from the start of the run.
///
/// TimePoint +/- Duration yields a TimePoint and the difference of two
/// TimePoints is a Duration. Two TimePoints cannot be added.
///
/// @ingroup core_types
class TimePoint {
    Duration since_start_;

    explicit constexpr TimePoint(Duration d) noexcept : since_start_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;

public:
    /// @brief The start of the run (t = 0).
    constexpr TimePoint() noexcept : since_start_(Duration::zero()) {}

    static constexpr TimePoint epoch() noexcept { return TimePoint{Duration::zero()}; }

    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept { return since_start_; }

    constexpr TimePoint operator+(Duration d) const noexcept { return TimePoint{since_start_ + d}; }
    constexpr TimePoint operator-(Duration d) const noexcept { return TimePoint{since_start_ - d}; }
    constexpr Duration operator-(TimePoint rhs) const noexcept { return since_start_ - rhs.since_start_; }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_start_ += d;
        return *this;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions between seconds and the integer representation
// ============================================================================

/// @brief Seconds to Duration, rounded to the nearest nanosecond.
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::nearest_ns(s)};
}

/// @brief Seconds to Duration, rounded up to the next nanosecond.
///
/// Used for transmission airtimes so that the completion event is never
/// earlier than the exact end of the transfer.
[[nodiscard]] constexpr Duration duration_from_seconds_ceil(double s) noexcept {
    return Duration{Duration::ceil_ns(s)};
}

[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Absolute instant @p s seconds after the start of the run.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Ratio a/b as a double (b must not be zero).
[[nodiscard]] constexpr double duration_ratio(Duration a, Duration b) noexcept {
    return a.seconds() / b.seconds();
}

} // namespace urllcsim::core
