#pragma once

#include <cstdint>

namespace wizctl
{
enum class DiscoveryState : std::uint8_t
{
    running,
    window_open,
    window_timer_running,
    repeat_timer_running,
    receiving_async,
};

inline const char* to_string(DiscoveryState state) noexcept
{
    switch (state)
    {
    case DiscoveryState::running:
        return "running";

    case DiscoveryState::window_open:
        return "window_open";

    case DiscoveryState::window_timer_running:
        return "window_timer_running";

    case DiscoveryState::repeat_timer_running:
        return "repeat_timer_running";

    case DiscoveryState::receiving_async:
        return "receiving_async";
    }

    return "unknown";
}

} // namespace wizctl
