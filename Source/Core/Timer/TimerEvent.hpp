// ============================================================================
// Chronos - Source/Core/Timer/TimerEvent.hpp
// ----------------------------------------------------------------------------
// Purpose : Immutable snapshot describing one tick or finish firing, plus the
//           callback binding timers use to hand it to application code.
// Contract: Header-only, no exceptions/RTTI. All types are trivially copyable.
// Notes   : timesFired / timerLifetime gives the firing rate without querying
//           the timer again.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <type_traits>

namespace chr::timer
{
    enum class TimerEventKind : chr::u8
    {
        Tick = 0, // One interval elapsed.
        Finish    // Duration elapsed; the timer is now Finished.
    };

    struct TimerEvent
    {
        TimerEventKind kind          = TimerEventKind::Tick;
        Timestamp      timestamp     = 0;   // Clock sample at the moment of firing.
        Seconds        deltaTime     = 0.0; // Seconds since the previous event of the same kind.
        Seconds        timerLifetime = 0.0; // Elapsed time of the timer at firing.
        chr::u64       timesFired    = 0;   // Count for this kind, including this event.

        [[nodiscard]] constexpr bool IsOfKind(TimerEventKind k) const noexcept { return kind == k; }
    };

    static_assert(std::is_trivially_copyable_v<TimerEvent>);

    struct TimerCallback
    {
        using Func = void(*)(void* userData, const TimerEvent& event) noexcept;

        Func  func     = nullptr;
        void* userData = nullptr;

        [[nodiscard]] constexpr bool IsBound() const noexcept { return func != nullptr; }

        void operator()(const TimerEvent& event) const noexcept
        {
            if (func)
            {
                func(userData, event);
            }
        }
    };

    static_assert(std::is_trivially_copyable_v<TimerCallback>);

    [[nodiscard]] constexpr TimerCallback MakeTimerCallback(TimerCallback::Func func, void* userData = nullptr) noexcept
    {
        return TimerCallback{func, userData};
    }

    [[nodiscard]] constexpr const char* ToString(TimerEventKind kind) noexcept
    {
        return (kind == TimerEventKind::Tick) ? "Tick" : "Finish";
    }

} // namespace chr::timer
