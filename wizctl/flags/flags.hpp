#pragma once

#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <type_traits>

namespace wizctl
{

/**
 * Set of boolean state bits keyed by an enum, safe to touch from any handler.
 * Engines use it to track which asynchronous operations are still outstanding.
 */
template <typename FlagType>
class Flags
{
    static_assert(std::is_enum<FlagType>::value, "FlagType must be an enum");

public:
    Flags() = default;

    void set_flag(FlagType flag)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _flags |= bit(flag);
    }

    void clear_flag(FlagType flag)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _flags &= ~bit(flag);
    }

    bool get_flag(FlagType flag) const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return (_flags & bit(flag)) != 0;
    }

    /**
     * @return true if at least one of the given flags is set
     */
    bool any_of(std::initializer_list<FlagType> flags) const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (FlagType flag : flags)
        {
            if ((_flags & bit(flag)) != 0)
            {
                return true;
            }
        }
        return false;
    }

private:
    static std::uint32_t bit(FlagType flag) { return 1U << static_cast<std::uint32_t>(flag); }

    std::uint32_t _flags = 0;
    mutable std::mutex _mutex;
};

} // namespace wizctl
