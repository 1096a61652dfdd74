// ============================================================================
// Chronos - Source/Core/Timer/TimerKind.hpp
// ----------------------------------------------------------------------------
// Purpose : Argument records for every timer flavor, the sum type grouping
//           them, and the one-shot step that configures a Timer from one.
// Contract: No exceptions/RTTI, no allocations. Records are plain data;
//           ValidateTimerKind() reports missing or invalid fields before
//           anything is applied, so a rejected kind never half-configures a
//           timer.
// Notes   : Flavor table
//             basic      interval (1.0)   no duration      onTick / onFinish
//             stopwatch  no interval      timeout (opt.)   onTimeout as finish
//             countdown  interval (1.0)   count            onCount / onFinish
//             countUp    interval (1.0)   count            onCount / onFinish
//             delay      delay            delay            onFinish only
//             schedule   window + frequency predicates     onSchedule / onFinish
// ============================================================================

#pragma once

#include "Core/Timer/TickPolicy.hpp"
#include "Core/Timer/TimerEvent.hpp"

#include <optional>
#include <variant>

namespace chr::timer
{
    class Timer;

    struct BasicArgs
    {
        Seconds       interval = 1.0;
        TimerCallback onTick{};
        TimerCallback onFinish{};
    };

    struct StopwatchArgs
    {
        std::optional<Seconds> timeout{};
        TimerCallback          onTimeout{};
    };

    struct CountdownArgs
    {
        Seconds       count    = 0.0;
        Seconds       interval = 1.0;
        TimerCallback onCount{};  // Required.
        TimerCallback onFinish{};
    };

    struct CountUpArgs
    {
        Seconds       count    = 0.0;
        Seconds       interval = 1.0;
        TimerCallback onCount{};  // Required.
        TimerCallback onFinish{};
    };

    struct DelayArgs
    {
        Seconds       delay = 0.0;
        TimerCallback onFinish{}; // Required.
    };

    struct ScheduleArgs
    {
        Timestamp     start = time::kDistantPast;
        Timestamp     end   = time::kDistantFuture;
        Frequency     frequency{};  // Required.
        TimerCallback onSchedule{}; // Required.
        TimerCallback onFinish{};
    };

    using TimerKind = std::variant<BasicArgs,
                                   StopwatchArgs,
                                   CountdownArgs,
                                   CountUpArgs,
                                   DelayArgs,
                                   ScheduleArgs>;

    static_assert(std::is_trivially_copyable_v<TimerKind>);

    enum class TimerKindTag : chr::u8
    {
        Basic = 0,
        Stopwatch,
        Countdown,
        CountUp,
        Delay,
        Schedule
    };

    [[nodiscard]] inline TimerKindTag GetKindTag(const TimerKind& kind) noexcept
    {
        return static_cast<TimerKindTag>(kind.index());
    }

    [[nodiscard]] constexpr const char* ToString(TimerKindTag tag) noexcept
    {
        switch (tag)
        {
            case TimerKindTag::Basic:     return "Basic";
            case TimerKindTag::Stopwatch: return "Stopwatch";
            case TimerKindTag::Countdown: return "Countdown";
            case TimerKindTag::CountUp:   return "CountUp";
            case TimerKindTag::Delay:     return "Delay";
            case TimerKindTag::Schedule:  return "Schedule";
            default:                      return "Unknown";
        }
    }

    enum class TimerConfigStatus : chr::u8
    {
        Ok = 0,
        AlreadyConfigured,
        MissingOnCount,
        MissingOnFinish,
        MissingOnSchedule,
        MissingFrequency,
        InvalidInterval,
        InvalidDuration,
        InvalidWindow,
        SubscribeFailed
    };

    [[nodiscard]] constexpr const char* ToString(TimerConfigStatus status) noexcept
    {
        switch (status)
        {
            case TimerConfigStatus::Ok:                return "Ok";
            case TimerConfigStatus::AlreadyConfigured: return "AlreadyConfigured";
            case TimerConfigStatus::MissingOnCount:    return "MissingOnCount";
            case TimerConfigStatus::MissingOnFinish:   return "MissingOnFinish";
            case TimerConfigStatus::MissingOnSchedule: return "MissingOnSchedule";
            case TimerConfigStatus::MissingFrequency:  return "MissingFrequency";
            case TimerConfigStatus::InvalidInterval:   return "InvalidInterval";
            case TimerConfigStatus::InvalidDuration:   return "InvalidDuration";
            case TimerConfigStatus::InvalidWindow:     return "InvalidWindow";
            case TimerConfigStatus::SubscribeFailed:   return "SubscribeFailed";
            default:                                   return "Unknown";
        }
    }

    // ------------------------------------------------------------------------
    // Construction surface (one entry point per flavor)
    // ------------------------------------------------------------------------

    [[nodiscard]] inline TimerKind Basic(Seconds interval = 1.0,
                                         TimerCallback onTick = {},
                                         TimerCallback onFinish = {}) noexcept
    {
        return BasicArgs{interval, onTick, onFinish};
    }

    [[nodiscard]] inline TimerKind Stopwatch(std::optional<Seconds> timeout = std::nullopt,
                                             TimerCallback onTimeout = {}) noexcept
    {
        return StopwatchArgs{timeout, onTimeout};
    }

    [[nodiscard]] inline TimerKind Countdown(Seconds count,
                                             TimerCallback onCount,
                                             Seconds interval = 1.0,
                                             TimerCallback onFinish = {}) noexcept
    {
        return CountdownArgs{count, interval, onCount, onFinish};
    }

    [[nodiscard]] inline TimerKind CountUp(Seconds count,
                                           TimerCallback onCount,
                                           Seconds interval = 1.0,
                                           TimerCallback onFinish = {}) noexcept
    {
        return CountUpArgs{count, interval, onCount, onFinish};
    }

    [[nodiscard]] inline TimerKind Delay(Seconds delay, TimerCallback onFinish) noexcept
    {
        return DelayArgs{delay, onFinish};
    }

    [[nodiscard]] inline TimerKind Schedule(Timestamp start,
                                            Timestamp end,
                                            Frequency frequency,
                                            TimerCallback onSchedule,
                                            TimerCallback onFinish = {}) noexcept
    {
        return ScheduleArgs{start, end, frequency, onSchedule, onFinish};
    }

    // ------------------------------------------------------------------------
    // Validation and application
    // ------------------------------------------------------------------------

    [[nodiscard]] TimerConfigStatus ValidateTimerKind(const TimerKind& kind) noexcept;

    // Writes interval, duration, callbacks and custom decisions into `timer`.
    // Callers validate first; Timer::Configure() does both.
    void ApplyTimerKind(const TimerKind& kind, Timer& timer) noexcept;

    // Custom decisions installed on schedule timers. They read the ScheduleArgs
    // stored in the timer's kind and the wall-clock sample of the current advance.
    [[nodiscard]] bool ScheduleShouldTick(void* userData, const Timer& timer) noexcept;
    [[nodiscard]] bool ScheduleShouldFinish(void* userData, const Timer& timer) noexcept;

} // namespace chr::timer
