#pragma once

#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace wizctl
{

enum class SlotState
{
    pending,
    succeeded,
    failed
};

inline const char* to_string(SlotState state) noexcept
{
    switch (state)
    {
    case SlotState::pending:
        return "pending";
    case SlotState::succeeded:
        return "succeeded";
    case SlotState::failed:
        return "failed";
    }
    return "unknown";
}

/**
 * @brief Single-assignment cell holding the outcome of one call.
 *
 * Starts pending and moves to succeeded or failed exactly once. Every handler that wants to
 * settle the call goes through try_succeed()/try_fail(); only the first one wins.
 */
template <typename ValueType>
class ResultSlot
{
public:
    ResultSlot() = default;

    ResultSlot(const ResultSlot&)            = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;

    /// @return true if this call settled the slot
    bool try_succeed(ValueType value)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != SlotState::pending)
        {
            return false;
        }
        _value = std::move(value);
        _state = SlotState::succeeded;
        return true;
    }

    /// @return true if this call settled the slot
    bool try_fail(std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != SlotState::pending)
        {
            return false;
        }
        _error = std::move(error);
        _state = SlotState::failed;
        return true;
    }

    template <typename ErrorType>
    bool try_fail_with(ErrorType error)
    {
        return try_fail(std::make_exception_ptr(std::move(error)));
    }

    SlotState state() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    bool is_pending() const { return state() == SlotState::pending; }

    /**
     * Moves the value out, or rethrows the stored error.
     * @throws std::logic_error while still pending
     */
    ValueType take()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state == SlotState::pending)
        {
            throw std::logic_error("ResultSlot::take called on a pending slot");
        }
        if (_state == SlotState::failed)
        {
            std::rethrow_exception(_error);
        }
        return std::move(*_value);
    }

    std::exception_ptr error() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _error;
    }

private:
    mutable std::mutex _mutex;
    SlotState _state = SlotState::pending;
    std::optional<ValueType> _value;
    std::exception_ptr _error;
};

} // namespace wizctl
