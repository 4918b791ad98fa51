#include "wizctl/retry/retry_policy.hpp"

#include <algorithm>
#include <limits>

namespace wizctl
{

namespace
{
constexpr RetryPolicy::duration::rep max_rep = std::numeric_limits<RetryPolicy::duration::rep>::max();
} // namespace

RetryPolicy::duration saturating_add(RetryPolicy::duration lhs, RetryPolicy::duration rhs) noexcept
{
    if (lhs.count() > max_rep - rhs.count())
    {
        return RetryPolicy::duration(max_rep);
    }
    return lhs + rhs;
}

RetryPolicy::duration saturating_multiply(RetryPolicy::duration value, std::size_t factor) noexcept
{
    if (factor == 0 || value.count() == 0)
    {
        return RetryPolicy::duration::zero();
    }
    if (static_cast<unsigned long long>(value.count()) > static_cast<unsigned long long>(max_rep) / factor)
    {
        return RetryPolicy::duration(max_rep);
    }
    return RetryPolicy::duration(value.count() * static_cast<RetryPolicy::duration::rep>(factor));
}

std::chrono::steady_clock::time_point saturating_deadline(std::chrono::steady_clock::time_point start,
                                                          RetryPolicy::duration delay) noexcept
{
    using time_point = std::chrono::steady_clock::time_point;

    if (delay <= RetryPolicy::duration::zero())
    {
        return start;
    }

    const auto headroom = std::chrono::duration_cast<RetryPolicy::duration>(time_point::max() - start);
    if (delay >= headroom)
    {
        return time_point::max();
    }
    return start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);
}

RetryPolicy::RetryPolicy(std::size_t max_retries, RetryStrategy strategy, duration base_interval, std::optional<duration> cap_interval)
    : _max_retries(max_retries)
    , _strategy(strategy)
    , _base_interval(std::max(base_interval, duration::zero()))
    , _cap_interval(strategy == RetryStrategy::exponential ? cap_interval : std::optional<duration>())
{
}

RetryPolicy RetryPolicy::disabled()
{
    return RetryPolicy(0, RetryStrategy::fixed, duration::zero());
}

RetryPolicy RetryPolicy::fixed(std::size_t max_retries, duration interval)
{
    return RetryPolicy(max_retries, RetryStrategy::fixed, interval);
}

RetryPolicy RetryPolicy::exponential(std::size_t max_retries, duration initial_interval, std::optional<duration> cap_interval)
{
    return RetryPolicy(max_retries, RetryStrategy::exponential, initial_interval, cap_interval.value_or(default_exponential_cap));
}

RetryPolicy::duration RetryPolicy::next_interval(duration current) const noexcept
{
    if (_strategy == RetryStrategy::fixed)
    {
        return _base_interval;
    }

    duration doubled = saturating_multiply(std::max(current, duration::zero()), 2);
    if (_cap_interval)
    {
        return std::min(doubled, *_cap_interval);
    }
    return doubled;
}

RetryPolicy::duration RetryPolicy::total_retry_delay() const noexcept
{
    duration total    = duration::zero();
    duration interval = _base_interval;
    for (std::size_t retry = 0; retry < _max_retries; ++retry)
    {
        total = saturating_add(total, interval);
        if (total.count() == max_rep)
        {
            break;
        }
        interval = next_interval(interval);
    }
    return total;
}

} // namespace wizctl
