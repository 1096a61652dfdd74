// ============================================================================
// Chronos - Source/Core/Timer/TimerKind.cpp
// ----------------------------------------------------------------------------
// Purpose : Validation and application of timer flavors, plus the schedule
//           flavor's custom tick/finish decisions.
// Contract: No exceptions/RTTI, no allocations. Dispatch is a std::visit over
//           the TimerKind alternatives.
// ============================================================================

#include "Core/Timer/TimerKind.hpp"

#include "Core/Timer/Timer.hpp"

#include <cmath>
#include <type_traits>

namespace chr::timer
{
namespace
{
    [[nodiscard]] bool IsPositiveSpan(Seconds value) noexcept
    {
        return std::isfinite(value) && value > 0.0;
    }

    template <typename>
    inline constexpr bool kAlwaysFalse = false;
}

    TimerConfigStatus ValidateTimerKind(const TimerKind& kind) noexcept
    {
        return std::visit([](const auto& args) noexcept -> TimerConfigStatus
        {
            using Args = std::decay_t<decltype(args)>;

            if constexpr (std::is_same_v<Args, BasicArgs>)
            {
                return IsPositiveSpan(args.interval) ? TimerConfigStatus::Ok : TimerConfigStatus::InvalidInterval;
            }
            else if constexpr (std::is_same_v<Args, StopwatchArgs>)
            {
                if (args.timeout.has_value() && !IsPositiveSpan(*args.timeout))
                {
                    return TimerConfigStatus::InvalidDuration;
                }
                return TimerConfigStatus::Ok;
            }
            else if constexpr (std::is_same_v<Args, CountdownArgs> || std::is_same_v<Args, CountUpArgs>)
            {
                if (!args.onCount.IsBound())
                {
                    return TimerConfigStatus::MissingOnCount;
                }
                if (!IsPositiveSpan(args.interval))
                {
                    return TimerConfigStatus::InvalidInterval;
                }
                if (!IsPositiveSpan(args.count))
                {
                    return TimerConfigStatus::InvalidDuration;
                }
                return TimerConfigStatus::Ok;
            }
            else if constexpr (std::is_same_v<Args, DelayArgs>)
            {
                if (!args.onFinish.IsBound())
                {
                    return TimerConfigStatus::MissingOnFinish;
                }
                return IsPositiveSpan(args.delay) ? TimerConfigStatus::Ok : TimerConfigStatus::InvalidDuration;
            }
            else if constexpr (std::is_same_v<Args, ScheduleArgs>)
            {
                if (!args.onSchedule.IsBound())
                {
                    return TimerConfigStatus::MissingOnSchedule;
                }
                if (!args.frequency.IsBound())
                {
                    return TimerConfigStatus::MissingFrequency;
                }
                if (args.end < args.start)
                {
                    return TimerConfigStatus::InvalidWindow;
                }
                return TimerConfigStatus::Ok;
            }
            else
            {
                static_assert(kAlwaysFalse<Args>, "Unhandled TimerKind alternative");
            }
        }, kind);
    }

    void ApplyTimerKind(const TimerKind& kind, Timer& timer) noexcept
    {
        std::visit([&timer](const auto& args) noexcept
        {
            using Args = std::decay_t<decltype(args)>;

            if constexpr (std::is_same_v<Args, BasicArgs>)
            {
                timer.SetInterval(args.interval);
                timer.SetDuration(std::nullopt);
                timer.SetOnTick(args.onTick);
                timer.SetOnFinish(args.onFinish);
            }
            else if constexpr (std::is_same_v<Args, StopwatchArgs>)
            {
                timer.SetInterval(std::nullopt);
                timer.SetDuration(args.timeout);
                timer.SetOnTick(TimerCallback{});
                timer.SetOnFinish(args.onTimeout);
            }
            else if constexpr (std::is_same_v<Args, CountdownArgs> || std::is_same_v<Args, CountUpArgs>)
            {
                timer.SetInterval(args.interval);
                timer.SetDuration(args.count);
                timer.SetOnTick(args.onCount);
                timer.SetOnFinish(args.onFinish);
            }
            else if constexpr (std::is_same_v<Args, DelayArgs>)
            {
                timer.SetInterval(args.delay);
                timer.SetDuration(args.delay);
                timer.SetOnTick(TimerCallback{});
                timer.SetOnFinish(args.onFinish);
            }
            else if constexpr (std::is_same_v<Args, ScheduleArgs>)
            {
                timer.SetInterval(std::nullopt);
                timer.SetDuration(std::nullopt);
                timer.SetOnTick(args.onSchedule);
                timer.SetOnFinish(args.onFinish);
                timer.SetCustomShouldTick(TimerDecision{&ScheduleShouldTick, nullptr});
                timer.SetCustomShouldFinish(TimerDecision{&ScheduleShouldFinish, nullptr});
            }
            else
            {
                static_assert(kAlwaysFalse<Args>, "Unhandled TimerKind alternative");
            }
        }, kind);
    }

    bool ScheduleShouldTick(void* userData, const Timer& timer) noexcept
    {
        (void)userData;
        const ScheduleArgs* args = std::get_if<ScheduleArgs>(&timer.GetKind());
        if (args == nullptr)
        {
            return false;
        }

        return ShouldTickInWindow(timer.GetFrameTimestamp(), args->start, args->end, args->frequency);
    }

    bool ScheduleShouldFinish(void* userData, const Timer& timer) noexcept
    {
        (void)userData;
        const ScheduleArgs* args = std::get_if<ScheduleArgs>(&timer.GetKind());
        if (args == nullptr)
        {
            return false;
        }

        return ShouldFinishWindow(timer.GetFrameTimestamp(), args->end);
    }

} // namespace chr::timer
