#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace wizctl
{

enum class RetryStrategy
{
    fixed,
    exponential
};

inline const char* to_string(RetryStrategy strategy) noexcept
{
    switch (strategy)
    {
    case RetryStrategy::fixed:
        return "fixed";
    case RetryStrategy::exponential:
        return "exponential";
    }
    return "unknown";
}

/**
 * @brief How many times to retry a request and how long to wait between retries.
 *
 * Immutable value. The interval in effect during a running retry sequence belongs to
 * the consumer, which feeds it back through next_interval().
 *
 * Example:
 * @code
 * auto policy   = RetryPolicy::exponential(4, std::chrono::milliseconds(500), std::chrono::seconds(3));
 * auto interval = policy.base_interval();       // 500ms
 * interval      = policy.next_interval(interval); // 1s
 * @endcode
 */
class RetryPolicy
{
public:
    using duration = std::chrono::milliseconds;

    /// Cap applied by exponential() when none is given.
    static constexpr duration default_exponential_cap = std::chrono::seconds(3);

    RetryPolicy(std::size_t max_retries, RetryStrategy strategy, duration base_interval, std::optional<duration> cap_interval = std::nullopt);

    /// Single attempt, no retries.
    static RetryPolicy disabled();

    /**
     * @param max_retries Number of retries (total attempts = max_retries + 1).
     * @param interval Wait between consecutive attempts.
     */
    static RetryPolicy fixed(std::size_t max_retries, duration interval);

    /**
     * @param max_retries Number of retries (total attempts = max_retries + 1).
     * @param initial_interval Wait before the first retry.
     * @param cap_interval Upper bound on the wait, default_exponential_cap when omitted.
     */
    static RetryPolicy exponential(std::size_t max_retries, duration initial_interval,
                                   std::optional<duration> cap_interval = std::nullopt);

    std::size_t max_retries() const noexcept { return _max_retries; }
    RetryStrategy strategy() const noexcept { return _strategy; }
    duration base_interval() const noexcept { return _base_interval; }
    const std::optional<duration>& cap_interval() const noexcept { return _cap_interval; }

    bool enabled() const noexcept { return _max_retries > 0; }
    std::size_t total_attempts() const noexcept { return _max_retries + 1; }

    /**
     * Interval to use after @p current.
     * Fixed: always base_interval. Exponential: min(current * 2, cap), saturating instead of overflowing.
     */
    duration next_interval(duration current) const noexcept;

    /// Sum of every wait a full retry sequence goes through. Saturates.
    duration total_retry_delay() const noexcept;

private:
    std::size_t _max_retries;
    RetryStrategy _strategy;
    duration _base_interval;
    std::optional<duration> _cap_interval;
};

/// Adds two non-negative durations, clamping at the largest representable value.
RetryPolicy::duration saturating_add(RetryPolicy::duration lhs, RetryPolicy::duration rhs) noexcept;

/// Multiplies a non-negative duration, clamping at the largest representable value.
RetryPolicy::duration saturating_multiply(RetryPolicy::duration value, std::size_t factor) noexcept;

/**
 * @p start + @p delay on the steady clock, clamped to the latest representable time point.
 * Every timer is armed through this so that huge or saturated intervals never overflow.
 */
std::chrono::steady_clock::time_point saturating_deadline(std::chrono::steady_clock::time_point start,
                                                          RetryPolicy::duration delay) noexcept;

} // namespace wizctl
