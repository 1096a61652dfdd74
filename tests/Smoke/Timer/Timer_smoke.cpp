#include "Core/Time/ManualClock.hpp"
#include "Core/Timer/Timer.hpp"
#include "TimerRecorders.hpp"

#include <limits>

namespace
{
    using namespace chr::timer;
    using chr::tests::CallbackRecorder;
    using chr::tests::NearlyEqual;

    constexpr chr::Timestamp kClockStartNs = 1'700'000'000LL * chr::time::kNanosecondsPerSecond;

    constexpr TimerState kAllStates[] = {
        TimerState::New,
        TimerState::Active,
        TimerState::Inactive,
        TimerState::Finished
    };

    [[nodiscard]] TimerEnvironment MakeManualEnvironment(chr::time::ManualClock& clock) noexcept
    {
        TimerEnvironment environment{};
        environment.clock = chr::time::MakeManualClockInterface(clock);
        return environment;
    }

    // Countdown of 1s with 0.25s counts: every state is reachable and every
    // counter moves before the timer finishes.
    [[nodiscard]] bool ConfigureCountingTimer(Timer& timer, CallbackRecorder& onCount, chr::time::ManualClock& clock) noexcept
    {
        return timer.Configure(Countdown(1.0, onCount.Bind(), 0.25), MakeManualEnvironment(clock)) == TimerConfigStatus::Ok;
    }

    [[nodiscard]] bool DriveToState(Timer& timer, TimerState target) noexcept
    {
        switch (target)
        {
            case TimerState::New:
                break;
            case TimerState::Active:
                (void)timer.Start();
                timer.Advance(0.5);
                break;
            case TimerState::Inactive:
                (void)timer.Start();
                timer.Advance(0.5);
                (void)timer.Stop();
                break;
            case TimerState::Finished:
                (void)timer.Start();
                timer.Advance(1.5);
                break;
        }
        return timer.GetState() == target;
    }

    [[nodiscard]] bool IsZeroed(const Timer& timer) noexcept
    {
        return timer.GetState() == TimerState::New &&
               timer.GetElapsedTime() == 0.0 &&
               timer.GetElapsedSinceLastTick() == 0.0 &&
               timer.GetElapsedSinceLastFinish() == 0.0 &&
               !timer.GetTimestampOfLastTick().has_value() &&
               !timer.GetTimestampOfLastFinish().has_value() &&
               timer.GetTimesTicked() == 0 &&
               timer.GetTimesFinished() == 0;
    }

    bool AlwaysDecide(void* userData, const Timer& timer) noexcept
    {
        (void)timer;
        auto* calls = static_cast<chr::u32*>(userData);
        if (calls != nullptr)
        {
            ++(*calls);
        }
        return true;
    }

    bool NeverDecide(void* userData, const Timer& timer) noexcept
    {
        (void)userData;
        (void)timer;
        return false;
    }

    struct ResettingCallback
    {
        Timer* timer = nullptr;

        static void OnTick(void* userData, const TimerEvent& event) noexcept
        {
            (void)event;
            auto* self = static_cast<ResettingCallback*>(userData);
            (void)self->timer->Reset();
        }
    };
}

int RunTimerSmoke()
{
    using namespace chr::timer;
    chr::time::ManualClock clock{};
    clock.Set(kClockStartNs);

    // Unconfigured timers refuse to run.
    {
        Timer timer{};
        if (timer.IsConfigured() || timer.Start() || timer.GetState() != TimerState::New)
        {
            return 1;
        }

        if (!timer.Reset() || timer.GetState() != TimerState::New)
        {
            return 2;
        }
    }

    // Start succeeds exactly from New and Inactive.
    for (const TimerState state : kAllStates)
    {
        CallbackRecorder onCount{};
        Timer timer{};
        if (!ConfigureCountingTimer(timer, onCount, clock) || !DriveToState(timer, state))
        {
            return 3;
        }

        const bool started = timer.Start();
        if (started != CanStart(state))
        {
            return 4;
        }

        if (started ? (timer.GetState() != TimerState::Active) : (timer.GetState() != state))
        {
            return 5;
        }
    }

    // Stop succeeds exactly from Active.
    for (const TimerState state : kAllStates)
    {
        CallbackRecorder onCount{};
        Timer timer{};
        if (!ConfigureCountingTimer(timer, onCount, clock) || !DriveToState(timer, state))
        {
            return 6;
        }

        const chr::Seconds elapsedBefore = timer.GetElapsedTime();
        const bool stopped = timer.Stop();
        if (stopped != (state == TimerState::Active))
        {
            return 7;
        }

        if (stopped ? (timer.GetState() != TimerState::Inactive) : (timer.GetState() != state))
        {
            return 8;
        }

        if (timer.GetElapsedTime() != elapsedBefore)
        {
            return 9;
        }
    }

    // Reset succeeds from every state, zeroes the data and keeps the behaviour.
    for (const TimerState state : kAllStates)
    {
        CallbackRecorder onCount{};
        Timer timer{};
        if (!ConfigureCountingTimer(timer, onCount, clock) || !DriveToState(timer, state))
        {
            return 10;
        }

        if (!timer.Reset() || !IsZeroed(timer))
        {
            return 11;
        }

        if (timer.GetInterval() != 0.25 || timer.GetDuration() != 1.0 || !timer.GetOnTick().IsBound())
        {
            return 12;
        }

        if (!timer.Start())
        {
            return 13;
        }
    }

    // Starting twice: the second call is refused and changes nothing.
    {
        CallbackRecorder onCount{};
        Timer timer{};
        if (!ConfigureCountingTimer(timer, onCount, clock) || !timer.Start())
        {
            return 14;
        }

        if (timer.Start() || timer.GetState() != TimerState::Active)
        {
            return 15;
        }
    }

    // Tick firing: interval 1.0 driven by 0.4s frames ticks on the third frame.
    {
        CallbackRecorder onTick{};
        Timer timer{};
        if (timer.Configure(Basic(1.0, onTick.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 16;
        }

        timer.Advance(0.4);
        timer.Advance(0.4);
        if (onTick.calls != 0 || timer.GetTimesTicked() != 0)
        {
            return 17;
        }

        timer.Advance(0.4);
        if (onTick.calls != 1 || !onTick.last.IsOfKind(TimerEventKind::Tick))
        {
            return 18;
        }

        if (!NearlyEqual(onTick.last.deltaTime, 1.2) ||
            !NearlyEqual(onTick.last.timerLifetime, 1.2) ||
            onTick.last.timesFired != 1 ||
            onTick.last.timestamp != kClockStartNs)
        {
            return 19;
        }

        if (timer.GetElapsedSinceLastTick() != 0.0 ||
            timer.GetTimesTicked() != 1 ||
            timer.GetTimestampOfLastTick() != kClockStartNs ||
            !NearlyEqual(timer.GetElapsedTime(), 1.2))
        {
            return 20;
        }

        // Basic timers never finish on their own.
        if (timer.GetState() != TimerState::Active || timer.GetTimesFinished() != 0)
        {
            return 21;
        }
    }

    // Finish firing: duration 1.0, one 1.5s frame.
    {
        CallbackRecorder onTimeout{};
        Timer timer{};
        if (timer.Configure(Stopwatch(1.0, onTimeout.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 22;
        }

        clock.AdvanceBySeconds(1.5);
        timer.Advance(1.5);
        if (onTimeout.calls != 1 || !onTimeout.last.IsOfKind(TimerEventKind::Finish))
        {
            return 23;
        }

        if (!NearlyEqual(onTimeout.last.deltaTime, 1.5) || onTimeout.last.timesFired != 1)
        {
            return 24;
        }

        if (timer.GetState() != TimerState::Finished || timer.GetTimesFinished() != 1 ||
            timer.GetElapsedSinceLastFinish() != 0.0 || timer.GetTimestampOfLastFinish() != clock.currentNs)
        {
            return 25;
        }

        if (timer.Start() || timer.Stop() || timer.GetState() != TimerState::Finished)
        {
            return 26;
        }

        if (!timer.Reset() || !timer.Start())
        {
            return 27;
        }
    }

    // Counters never decrease across frames.
    {
        CallbackRecorder onTick{};
        Timer timer{};
        if (timer.Configure(Basic(0.1, onTick.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 28;
        }

        chr::u64 previous = 0;
        for (int frame = 0; frame < 40; ++frame)
        {
            timer.Advance(0.037);
            if (timer.GetTimesTicked() < previous ||
                timer.GetElapsedSinceLastTick() > timer.GetElapsedTime())
            {
                return 29;
            }
            previous = timer.GetTimesTicked();
        }

        if (previous == 0 || onTick.calls != previous)
        {
            return 30;
        }
    }

    // Bad deltas are zero-delta advances and get reported.
    {
        chr::tests::ScopedLogCapture capture{};
        CallbackRecorder onTick{};
        Timer timer{};
        if (timer.Configure(Basic(0.5, onTick.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 31;
        }

        timer.Advance(-1.0);
        timer.Advance(std::numeric_limits<chr::Seconds>::quiet_NaN());
        timer.Advance(std::numeric_limits<chr::Seconds>::infinity());
        if (timer.GetElapsedTime() != 0.0 || timer.GetElapsedSinceLastTick() != 0.0 ||
            timer.GetTimesTicked() != 0 || onTick.calls != 0)
        {
            return 32;
        }

        if (capture.GetWarnings() != 3)
        {
            return 33;
        }
    }

    // Custom decisions replace the default rules.
    {
        chr::u32 decisions = 0;
        CallbackRecorder onTick{};
        CallbackRecorder onTimeout{};
        Timer timer{};
        if (timer.Configure(Basic(10.0, onTick.Bind(), onTimeout.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok)
        {
            return 34;
        }

        timer.SetDuration(1.0);
        timer.SetCustomShouldTick(TimerDecision{&AlwaysDecide, &decisions});
        timer.SetCustomShouldFinish(TimerDecision{&NeverDecide, nullptr});
        (void)timer.Start();

        timer.Advance(0.01);
        timer.Advance(5.0);
        if (decisions != 2 || onTick.calls != 2 || onTimeout.calls != 0 || timer.GetState() != TimerState::Active)
        {
            return 35;
        }

        // Unbinding restores the default rules.
        timer.SetCustomShouldTick(TimerDecision{});
        timer.SetCustomShouldFinish(TimerDecision{});
        timer.Advance(1.0);
        if (onTick.calls != 2 || onTimeout.calls != 1 || timer.GetState() != TimerState::Finished)
        {
            return 36;
        }
    }

    // A tick and a finish can land in the same frame; tick comes first.
    {
        chr::tests::SequenceLog sequence{};
        CallbackRecorder onCount{};
        CallbackRecorder onFinish{};
        onCount.sequence = &sequence;
        onCount.mark = 't';
        onFinish.sequence = &sequence;
        onFinish.mark = 'f';

        Timer timer{};
        if (timer.Configure(Countdown(2.0, onCount.Bind(), 2.0, onFinish.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 37;
        }

        timer.Advance(2.0);
        if (!sequence.Equals("tf") || timer.GetTimesTicked() != 1 || timer.GetTimesFinished() != 1)
        {
            return 38;
        }
    }

    // Finishing does not require a started timer when advanced by hand.
    {
        CallbackRecorder onTimeout{};
        Timer timer{};
        if (timer.Configure(Stopwatch(1.0, onTimeout.Bind()), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok)
        {
            return 39;
        }

        timer.Advance(1.0);
        if (timer.GetState() != TimerState::Finished || onTimeout.calls != 1)
        {
            return 40;
        }
    }

    // A callback may reset its own timer.
    {
        ResettingCallback resetter{};
        Timer timer{};
        resetter.timer = &timer;
        if (timer.Configure(Basic(1.0, MakeTimerCallback(&ResettingCallback::OnTick, &resetter)), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok ||
            !timer.Start())
        {
            return 41;
        }

        timer.Advance(1.0);
        if (!IsZeroed(timer))
        {
            return 42;
        }
    }

    // Restart from Finished runs again with fresh counters.
    {
        CallbackRecorder onCount{};
        Timer timer{};
        if (!ConfigureCountingTimer(timer, onCount, clock) || !DriveToState(timer, TimerState::Finished))
        {
            return 43;
        }

        if (!timer.Restart() || timer.GetState() != TimerState::Active || timer.GetTimesTicked() != 0 || timer.GetTimesFinished() != 0)
        {
            return 44;
        }
    }

    // Configuration is one-shot.
    {
        Timer timer{};
        if (timer.Configure(Basic(), MakeManualEnvironment(clock)) != TimerConfigStatus::Ok)
        {
            return 45;
        }

        if (timer.Configure(Stopwatch(), MakeManualEnvironment(clock)) != TimerConfigStatus::AlreadyConfigured ||
            GetKindTag(timer.GetKind()) != TimerKindTag::Basic)
        {
            return 46;
        }
    }

    // Without an injected clock the system clock stamps events.
    {
        CallbackRecorder onTick{};
        Timer timer{};
        if (timer.Configure(Basic(1.0, onTick.Bind())) != TimerConfigStatus::Ok || !timer.Start())
        {
            return 47;
        }

        timer.Advance(1.0);
        if (onTick.calls != 1 || onTick.last.timestamp <= kClockStartNs)
        {
            return 48;
        }
    }

    return 0;
}
