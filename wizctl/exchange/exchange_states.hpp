#pragma once

#include <cstdint>

namespace wizctl
{
enum class ExchangeState : std::uint8_t
{
    running,
    sending_async,
    receiving_async,
    attempt_timer_running,
    retry_timer_running,
};

inline const char* to_string(ExchangeState state) noexcept
{
    switch (state)
    {
    case ExchangeState::running:
        return "running";
    case ExchangeState::sending_async:
        return "sending_async";
    case ExchangeState::receiving_async:
        return "receiving_async";
    case ExchangeState::attempt_timer_running:
        return "attempt_timer_running";
    case ExchangeState::retry_timer_running:
        return "retry_timer_running";
    }
    return "unknown";
}

} // namespace wizctl
