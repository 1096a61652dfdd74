#include "Core/Time/ManualClock.hpp"
#include "Core/Timer/Timer.hpp"
#include "Core/Timer/TimerObserver.hpp"
#include "TimerRecorders.hpp"

#include <utility>

namespace
{
    using namespace chr::timer;

    // Implements only the lifecycle half through the dynamic face.
    struct StartOnlyCounter
    {
        chr::u32 starts = 0;

        static void OnStart(void* userData, const Timer& timer) noexcept
        {
            (void)timer;
            ++static_cast<StartOnlyCounter*>(userData)->starts;
        }
    };

    // Unregisters itself from inside a notification.
    struct SelfRetiringObserver
    {
        ObserverRegistry* registry = nullptr;
        ObserverHandle    handle{};
        chr::u32          ticks = 0;

        void DidStart(const Timer& timer) noexcept { (void)timer; }
        void DidStop(const Timer& timer) noexcept { (void)timer; }
        void DidReset(const Timer& timer) noexcept { (void)timer; }
        void DidRestart(const Timer& timer) noexcept { (void)timer; }
        void DidFinish(const TimerEvent& event, const Timer& timer) noexcept { (void)event; (void)timer; }

        void DidTick(const TimerEvent& event, const Timer& timer) noexcept
        {
            (void)event;
            (void)timer;
            ++ticks;
            (void)registry->Unregister(handle);
        }
    };

    [[nodiscard]] TimerEnvironment MakeEnvironment(chr::time::ManualClock& clock, ObserverRegistry& registry) noexcept
    {
        TimerEnvironment environment{};
        environment.clock     = chr::time::MakeManualClockInterface(clock);
        environment.observers = &registry;
        return environment;
    }
}

int RunTimerObserverSmoke()
{
    using chr::tests::CallbackRecorder;
    using chr::tests::RecordingObserver;
    using chr::tests::SequenceLog;

    chr::time::ManualClock clock{};

    // Registry bookkeeping: generations, capacity, rejection of empty observers.
    {
        ObserverRegistry registry{};
        RecordingObserver observers[kObserverRegistryCapacity + 1]{};

        if (registry.Register(TimerObserverInterface{}).IsValid())
        {
            return 1;
        }

        ObserverHandle handles[kObserverRegistryCapacity]{};
        for (chr::u32 i = 0; i < kObserverRegistryCapacity; ++i)
        {
            handles[i] = registry.Register(MakeTimerObserverInterface(observers[i]));
            if (!handles[i].IsValid() || handles[i].slot != i || handles[i].generation != 1)
            {
                return 2;
            }
        }

        if (registry.activeCount != kObserverRegistryCapacity ||
            registry.Register(MakeTimerObserverInterface(observers[kObserverRegistryCapacity])).IsValid())
        {
            return 3;
        }

        if (!registry.Unregister(handles[5]) || registry.Unregister(handles[5]) || registry.IsAlive(handles[5]))
        {
            return 4;
        }

        // The freed slot is reused under a new generation; the old handle stays dead.
        const ObserverHandle reused = registry.Register(MakeTimerObserverInterface(observers[kObserverRegistryCapacity]));
        if (reused.slot != 5 || reused.generation != 2 || registry.IsAlive(handles[5]) || !registry.IsAlive(reused))
        {
            return 5;
        }

        if (registry.Resolve(ObserverHandle{kObserverRegistryCapacity + 3, 1}) != nullptr)
        {
            return 6;
        }
    }

    // Notification order against callbacks, through a full countdown.
    {
        ObserverRegistry registry{};
        SequenceLog sequence{};
        RecordingObserver observer{};
        observer.sequence = &sequence;

        CallbackRecorder onCount{};
        CallbackRecorder onFinish{};
        onCount.sequence  = &sequence;
        onCount.mark      = 't';
        onFinish.sequence = &sequence;
        onFinish.mark     = 'f';

        Timer timer{};
        if (timer.Configure(Countdown(1.0, onCount.Bind(), 0.5, onFinish.Bind()), MakeEnvironment(clock, registry)) != TimerConfigStatus::Ok)
        {
            return 7;
        }

        const ObserverHandle handle = registry.Register(MakeTimerObserverInterface(observer));
        if (!timer.SetObserver(handle) || timer.GetObserver().generation != handle.generation)
        {
            return 8;
        }

        (void)timer.Start();
        timer.Advance(0.5);
        timer.Advance(0.5);

        // Observer first, callback second; auto-finish reports the stop before the finish.
        if (!sequence.Equals("sTtTtpFf"))
        {
            return 9;
        }

        if (observer.started != 1 || observer.stopped != 1 || observer.ticks != 2 || observer.finishes != 1)
        {
            return 10;
        }

        if (observer.stateSeenOnFinish != TimerState::Finished ||
            !observer.lastEvent.IsOfKind(TimerEventKind::Finish) ||
            observer.lastEvent.timesFired != 1)
        {
            return 11;
        }

        sequence.Clear();
        if (!timer.Restart() || !sequence.Equals("rsR") || observer.restarts != 1)
        {
            return 12;
        }

        sequence.Clear();
        if (!timer.Stop() || !timer.Reset() || !sequence.Equals("pr"))
        {
            return 13;
        }

        // Refused transitions notify nobody.
        sequence.Clear();
        (void)timer.Stop();
        if (sequence.count != 0)
        {
            return 14;
        }
    }

    // An unregistered observer is skipped silently; the timer keeps running.
    {
        ObserverRegistry registry{};
        RecordingObserver observer{};
        CallbackRecorder onTick{};

        Timer timer{};
        if (timer.Configure(Basic(1.0, onTick.Bind()), MakeEnvironment(clock, registry)) != TimerConfigStatus::Ok)
        {
            return 15;
        }

        const ObserverHandle handle = registry.Register(MakeTimerObserverInterface(observer));
        if (!timer.SetObserver(handle))
        {
            return 16;
        }

        (void)timer.Start();
        if (!registry.Unregister(handle))
        {
            return 17;
        }

        timer.Advance(1.0);
        if (observer.started != 1 || observer.ticks != 0 || onTick.calls != 1)
        {
            return 18;
        }

        // Dead handles are refused up front.
        if (timer.SetObserver(handle) || timer.SetObserver(ObserverHandle::Invalid()))
        {
            return 19;
        }
    }

    // ScopedObserverRegistration retires the handle with the scope.
    {
        ObserverRegistry registry{};
        RecordingObserver observer{};
        CallbackRecorder onTick{};

        Timer timer{};
        if (timer.Configure(Basic(1.0, onTick.Bind()), MakeEnvironment(clock, registry)) != TimerConfigStatus::Ok)
        {
            return 20;
        }

        ObserverHandle handle{};
        {
            ScopedObserverRegistration registration(registry, MakeTimerObserverInterface(observer));
            if (!registration.IsActive())
            {
                return 21;
            }

            ScopedObserverRegistration moved(std::move(registration));
            if (registration.IsActive() || !moved.IsActive())
            {
                return 22;
            }

            handle = moved.GetHandle();
            if (!timer.SetObserver(handle) || !timer.Start())
            {
                return 23;
            }
        }

        if (registry.IsAlive(handle) || registry.activeCount != 0)
        {
            return 24;
        }

        timer.Advance(1.0);
        if (observer.started != 1 || observer.ticks != 0)
        {
            return 25;
        }
    }

    // Observers attached to a foreign registry, with partial v-tables.
    {
        ObserverRegistry registry{};
        StartOnlyCounter counter{};
        TimerObserverInterface iface{};
        iface.userData        = &counter;
        iface.vtable.didStart = &StartOnlyCounter::OnStart;

        Timer timer{};
        if (timer.Configure(Stopwatch(1.0)) != TimerConfigStatus::Ok)
        {
            return 26;
        }

        const ObserverHandle handle = registry.Register(iface);
        if (timer.SetObserver(handle))
        {
            return 27; // No registry in the environment.
        }

        if (!timer.SetObserver(registry, handle))
        {
            return 28;
        }

        (void)timer.Start();
        timer.Advance(2.0);
        if (counter.starts != 1 || timer.GetState() != TimerState::Finished)
        {
            return 29;
        }

        timer.ClearObserver();
        if (timer.GetObserver().IsValid())
        {
            return 30;
        }
    }

    // An observer may unregister itself mid-notification.
    {
        ObserverRegistry registry{};
        SelfRetiringObserver observer{};
        observer.registry = &registry;

        Timer timer{};
        if (timer.Configure(Basic(0.5), MakeEnvironment(clock, registry)) != TimerConfigStatus::Ok)
        {
            return 31;
        }

        observer.handle = registry.Register(MakeTimerObserverInterface(observer));
        if (!timer.SetObserver(observer.handle) || !timer.Start())
        {
            return 32;
        }

        timer.Advance(0.5);
        timer.Advance(0.5);
        if (observer.ticks != 1 || timer.GetTimesTicked() != 2)
        {
            return 33;
        }
    }

    return 0;
}
