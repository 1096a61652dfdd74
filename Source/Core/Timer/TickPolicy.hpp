// ============================================================================
// Chronos - Source/Core/Timer/TickPolicy.hpp
// ----------------------------------------------------------------------------
// Purpose : Decision rules telling a timer whether to fire a tick or finish
//           event on the current advance, plus the bindings used to override
//           them and the frequency patterns consumed by schedule timers.
// Contract: Header-only, no exceptions/RTTI, no allocations. Rules are pure
//           functions of their arguments; bindings are function pointer +
//           userData pairs chosen by a presence check.
// Notes   : Default rules read the elapsed-time counters. Schedule rules read
//           only the wall-clock sample of the advance and the window bounds.
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"

#include <limits>
#include <optional>
#include <type_traits>

namespace chr::timer
{
    class Timer;

    // Replaces a default rule when bound; its answer is authoritative.
    struct TimerDecision
    {
        using Func = bool(*)(void* userData, const Timer& timer) noexcept;

        Func  func     = nullptr;
        void* userData = nullptr;

        [[nodiscard]] constexpr bool IsBound() const noexcept { return func != nullptr; }

        [[nodiscard]] bool operator()(const Timer& timer) const noexcept
        {
            return func ? func(userData, timer) : false;
        }
    };

    static_assert(std::is_trivially_copyable_v<TimerDecision>);

    // Returns true if `current`, inside [start, end), carries a scheduled event.
    struct Frequency
    {
        using Func = bool(*)(void* userData, Timestamp current, Timestamp start, Timestamp end) noexcept;

        Func  func     = nullptr;
        void* userData = nullptr;

        [[nodiscard]] constexpr bool IsBound() const noexcept { return func != nullptr; }

        [[nodiscard]] bool operator()(Timestamp current, Timestamp start, Timestamp end) const noexcept
        {
            return func ? func(userData, current, start, end) : false;
        }
    };

    static_assert(std::is_trivially_copyable_v<Frequency>);

    // ------------------------------------------------------------------------
    // Default rules
    // ------------------------------------------------------------------------

    [[nodiscard]] inline bool ShouldTickByInterval(const std::optional<Seconds>& interval,
                                                   Seconds elapsedSinceLastTick) noexcept
    {
        return interval.has_value() && elapsedSinceLastTick >= *interval;
    }

    [[nodiscard]] inline bool ShouldFinishByDuration(const std::optional<Seconds>& duration,
                                                     Seconds elapsedSinceLastFinish) noexcept
    {
        return duration.has_value() && elapsedSinceLastFinish >= *duration;
    }

    // ------------------------------------------------------------------------
    // Schedule window rules
    // ------------------------------------------------------------------------

    [[nodiscard]] inline bool ShouldTickInWindow(Timestamp current,
                                                 Timestamp start,
                                                 Timestamp end,
                                                 const Frequency& frequency) noexcept
    {
        if (current < start || current >= end)
        {
            return false;
        }

        return frequency(current, start, end);
    }

    [[nodiscard]] constexpr bool ShouldFinishWindow(Timestamp current, Timestamp end) noexcept
    {
        return current >= end;
    }

    // ------------------------------------------------------------------------
    // Frequency patterns
    // ------------------------------------------------------------------------

    namespace detail
    {
        inline bool AlwaysFires(void* userData, Timestamp current, Timestamp start, Timestamp end) noexcept
        {
            (void)userData;
            (void)current;
            (void)start;
            (void)end;
            return true;
        }
    } // namespace detail

    // Fires on every advance inside the window.
    [[nodiscard]] constexpr Frequency AlwaysFrequency() noexcept
    {
        return Frequency{&detail::AlwaysFires, nullptr};
    }

    // State for EveryFrequency(); must outlive the timer using it.
    struct PeriodicPattern
    {
        Timestamp periodNs       = time::kNanosecondsPerSecond;
        chr::i64  lastPeriodIndex = -1; // -1 until the first firing.

        void Rewind() noexcept { lastPeriodIndex = -1; }
    };

    namespace detail
    {
        inline bool FiresOncePerPeriod(void* userData, Timestamp current, Timestamp start, Timestamp end) noexcept
        {
            (void)end;
            auto* pattern = static_cast<PeriodicPattern*>(userData);
            if (pattern == nullptr || pattern->periodNs <= 0)
            {
                return false;
            }

            // Open-ended windows count periods from the epoch.
            const Timestamp origin = (start == time::kDistantPast) ? Timestamp{0} : start;
            if (current < origin)
            {
                return false;
            }

            // Unsigned span: a window starting near the far past overflows i64.
            const chr::u64 span  = static_cast<chr::u64>(current) - static_cast<chr::u64>(origin);
            const chr::u64 index = span / static_cast<chr::u64>(pattern->periodNs);
            constexpr chr::u64 kMaxIndex = static_cast<chr::u64>(std::numeric_limits<chr::i64>::max());
            const chr::i64 periodIndex = static_cast<chr::i64>(index > kMaxIndex ? kMaxIndex : index);
            if (periodIndex <= pattern->lastPeriodIndex)
            {
                return false;
            }

            pattern->lastPeriodIndex = periodIndex;
            return true;
        }
    } // namespace detail

    // Fires on the first advance of each `pattern.periodNs` slice of the window.
    [[nodiscard]] inline Frequency EveryFrequency(PeriodicPattern& pattern) noexcept
    {
        return Frequency{&detail::FiresOncePerPeriod, &pattern};
    }

} // namespace chr::timer
