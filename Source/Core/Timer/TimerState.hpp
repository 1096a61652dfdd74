// ============================================================================
// Chronos - Source/Core/Timer/TimerState.hpp
// ----------------------------------------------------------------------------
// Purpose : Lifecycle states of a timer and the predicates deciding which
//           public transitions are legal from each of them.
// Contract: Header-only, constexpr, no exceptions/RTTI.
// Notes   : Finished is reached only through the timer's internal finish step,
//           never through Start/Stop. Reset is legal from every state,
//           including New.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

namespace chr::timer
{
    enum class TimerState : chr::u8
    {
        New = 0,  // Brand new or just reset.
        Active,   // Started and receiving advances.
        Inactive, // Stopped; elapsed time is kept.
        Finished  // Duration reached; needs Reset() before running again.
    };

    [[nodiscard]] constexpr bool CanStart(TimerState state) noexcept
    {
        return state == TimerState::New || state == TimerState::Inactive;
    }

    [[nodiscard]] constexpr bool CanStop(TimerState state) noexcept
    {
        return state == TimerState::Active;
    }

    [[nodiscard]] constexpr bool CanReset(TimerState state) noexcept
    {
        (void)state;
        return true;
    }

    [[nodiscard]] constexpr const char* ToString(TimerState state) noexcept
    {
        switch (state)
        {
            case TimerState::New:      return "New";
            case TimerState::Active:   return "Active";
            case TimerState::Inactive: return "Inactive";
            case TimerState::Finished: return "Finished";
            default:                   return "Unknown";
        }
    }

} // namespace chr::timer
