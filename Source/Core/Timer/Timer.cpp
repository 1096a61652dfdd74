// ============================================================================
// Chronos - Source/Core/Timer/Timer.cpp
// ----------------------------------------------------------------------------
// Purpose : Timer engine implementation: state transitions, advance loop and
//           event emission.
// Contract: No exceptions/RTTI, no allocations; see Timer.hpp for threading.
// Notes   : Event order per advance is tick before finish. Within one event
//           the observer hears about it before the callback runs, and the
//           matching since-last counter is zeroed after both.
// ============================================================================

#include "Core/Timer/Timer.hpp"

#include "Core/Diagnostics/Check.hpp"
#include "Core/Logger.hpp"
#include "Core/Time/SystemClock.hpp"

#include <cmath>

namespace chr::timer
{
    Timer::~Timer() noexcept
    {
        if (mSubscription.IsValid())
        {
            time::Cancel(mTickSource, mSubscription);
            mSubscription = time::TickSubscription::Invalid();
        }
    }

    TimerConfigStatus Timer::Configure(const TimerKind& kind, const TimerEnvironment& environment) noexcept
    {
        const char* kindName = ToString(GetKindTag(kind));

        if (mIsConfigured)
        {
            CHR_LOG_WARNING("Timer", "Configure({}) rejected: timer is already configured as {}",
                            kindName, ToString(GetKindTag(mKind)));
            return TimerConfigStatus::AlreadyConfigured;
        }

        const TimerConfigStatus validation = ValidateTimerKind(kind);
        if (validation != TimerConfigStatus::Ok)
        {
            CHR_LOG_WARNING("Timer", "Configure({}) rejected: {}", kindName, ToString(validation));
            return validation;
        }

        time::TickSubscription subscription{};
        time::TickSourceInterface tickSource = environment.tickSource;
        if (tickSource.userData != nullptr)
        {
            if (time::IsBound(tickSource))
            {
                subscription = time::Subscribe(tickSource, time::TickSink{&Timer::AdvanceFromTickSource, this});
            }

            if (!subscription.IsValid())
            {
                CHR_LOG_WARNING("Timer", "Configure({}) rejected: {}", kindName, ToString(TimerConfigStatus::SubscribeFailed));
                return TimerConfigStatus::SubscribeFailed;
            }
        }

        mTickSource   = tickSource;
        mSubscription = subscription;
        mClock        = time::IsBound(environment.clock) ? environment.clock : time::MakeSystemClockInterface();
        mObservers    = environment.observers;
        mKind         = kind;

        ApplyTimerKind(mKind, *this);
        mIsConfigured = true;

        CHR_LOG_VERBOSE("Timer", "Configured {} timer (driven: {})", kindName, mSubscription.IsValid());
        return TimerConfigStatus::Ok;
    }

    // ------------------------------------------------------------------------
    // State control
    // ------------------------------------------------------------------------

    bool Timer::Start() noexcept
    {
        if (!mIsConfigured || !CanStart(mState))
        {
            return false;
        }

        mState = TimerState::Active;
        PauseDelivery(false);
        CHR_LOG_VERBOSE("Timer", "Started at {:.3f}s", mElapsedTime);
        NotifyLifecycle(&TimerObserverVTable::didStart);
        return true;
    }

    bool Timer::Stop() noexcept
    {
        if (!CanStop(mState))
        {
            return false;
        }

        mState = TimerState::Inactive;
        PauseDelivery(true);
        CHR_LOG_VERBOSE("Timer", "Stopped at {:.3f}s", mElapsedTime);
        NotifyLifecycle(&TimerObserverVTable::didStop);
        return true;
    }

    bool Timer::Reset() noexcept
    {
        if (!CanReset(mState))
        {
            return false;
        }

        mState                  = TimerState::New;
        mElapsedTime            = 0.0;
        mElapsedSinceLastTick   = 0.0;
        mElapsedSinceLastFinish = 0.0;
        mTimestampOfLastTick.reset();
        mTimestampOfLastFinish.reset();
        mTimesTicked   = 0;
        mTimesFinished = 0;
        PauseDelivery(true);

        CHR_LOG_VERBOSE("Timer", "Reset");
        NotifyLifecycle(&TimerObserverVTable::didReset);
        return true;
    }

    bool Timer::Restart() noexcept
    {
        if (!Reset() || !Start())
        {
            return false;
        }

        NotifyLifecycle(&TimerObserverVTable::didRestart);
        return true;
    }

    // ------------------------------------------------------------------------
    // Driving
    // ------------------------------------------------------------------------

    void Timer::AdvanceFromTickSource(void* target, Seconds deltaTime) noexcept
    {
        static_cast<Timer*>(target)->Advance(deltaTime);
    }

    void Timer::Advance(Seconds deltaTime) noexcept
    {
        if (!std::isfinite(deltaTime) || deltaTime < 0.0)
        {
            CHR_LOG_WARNING("Timer", "Ignoring invalid advance delta {}", deltaTime);
            return;
        }

        mElapsedTime            += deltaTime;
        mElapsedSinceLastTick   += deltaTime;
        mElapsedSinceLastFinish += deltaTime;
        mFrameTimestamp = time::NowNs(mClock);

        if (DecideTick(*this))
        {
            Tick(mFrameTimestamp);
        }

        if (DecideFinish(*this))
        {
            Finish(mFrameTimestamp);
        }

        CHR_CHECK(mElapsedSinceLastTick <= mElapsedTime);
        CHR_CHECK(mElapsedSinceLastFinish <= mElapsedTime);
    }

    void Timer::Tick(Timestamp now) noexcept
    {
        mTimestampOfLastTick = now;
        ++mTimesTicked;

        TimerEvent event{};
        event.kind          = TimerEventKind::Tick;
        event.timestamp     = now;
        event.deltaTime     = mElapsedSinceLastTick;
        event.timerLifetime = mElapsedTime;
        event.timesFired    = mTimesTicked;

        NotifyEvent(&TimerObserverVTable::didTick, event);
        mOnTick(event);

        mElapsedSinceLastTick = 0.0;
    }

    void Timer::Finish(Timestamp now) noexcept
    {
        // didStop fires here when the timer was running; the public state
        // then goes straight to Finished.
        (void)Stop();

        mState = TimerState::Finished;
        PauseDelivery(true);
        mTimestampOfLastFinish = now;
        ++mTimesFinished;

        TimerEvent event{};
        event.kind          = TimerEventKind::Finish;
        event.timestamp     = now;
        event.deltaTime     = mElapsedSinceLastFinish;
        event.timerLifetime = mElapsedTime;
        event.timesFired    = mTimesFinished;

        CHR_LOG_VERBOSE("Timer", "Finished after {:.3f}s ({} ticks)", mElapsedTime, mTimesTicked);
        NotifyEvent(&TimerObserverVTable::didFinish, event);
        mOnFinish(event);

        mElapsedSinceLastFinish = 0.0;
    }

    void Timer::PauseDelivery(bool paused) noexcept
    {
        time::SetPaused(mTickSource, mSubscription, paused);
    }

    // ------------------------------------------------------------------------
    // Observer
    // ------------------------------------------------------------------------

    bool Timer::SetObserver(ObserverHandle handle) noexcept
    {
        if (mObservers == nullptr || !mObservers->IsAlive(handle))
        {
            return false;
        }

        mObserver = handle;
        return true;
    }

    bool Timer::SetObserver(ObserverRegistry& registry, ObserverHandle handle) noexcept
    {
        if (!registry.IsAlive(handle))
        {
            return false;
        }

        mObservers = &registry;
        mObserver  = handle;
        return true;
    }

    void Timer::NotifyLifecycle(TimerObserverVTable::LifecycleFunc TimerObserverVTable::* entry) const noexcept
    {
        const TimerObserverInterface* observer = (mObservers != nullptr) ? mObservers->Resolve(mObserver) : nullptr;
        if (observer == nullptr)
        {
            return;
        }

        const TimerObserverInterface snapshot = *observer;
        if (const TimerObserverVTable::LifecycleFunc func = snapshot.vtable.*entry)
        {
            func(snapshot.userData, *this);
        }
    }

    void Timer::NotifyEvent(TimerObserverVTable::EventFunc TimerObserverVTable::* entry, const TimerEvent& event) const noexcept
    {
        const TimerObserverInterface* observer = (mObservers != nullptr) ? mObservers->Resolve(mObserver) : nullptr;
        if (observer == nullptr)
        {
            return;
        }

        const TimerObserverInterface snapshot = *observer;
        if (const TimerObserverVTable::EventFunc func = snapshot.vtable.*entry)
        {
            func(snapshot.userData, event, *this);
        }
    }

    // ------------------------------------------------------------------------
    // Decisions
    // ------------------------------------------------------------------------

    bool ShouldTickByDefault(const Timer& timer) noexcept
    {
        return ShouldTickByInterval(timer.GetInterval(), timer.GetElapsedSinceLastTick());
    }

    bool ShouldFinishByDefault(const Timer& timer) noexcept
    {
        return ShouldFinishByDuration(timer.GetDuration(), timer.GetElapsedSinceLastFinish());
    }

    bool DecideTick(const Timer& timer) noexcept
    {
        const TimerDecision& custom = timer.GetCustomShouldTick();
        return custom.IsBound() ? custom(timer) : ShouldTickByDefault(timer);
    }

    bool DecideFinish(const Timer& timer) noexcept
    {
        const TimerDecision& custom = timer.GetCustomShouldFinish();
        return custom.IsBound() ? custom(timer) : ShouldFinishByDefault(timer);
    }

} // namespace chr::timer
