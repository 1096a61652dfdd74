// ============================================================================
// Chronos - Source/Core/Timer/Timer.hpp
// ----------------------------------------------------------------------------
// Purpose : The timer engine shared by every flavor: lifecycle state machine,
//           per-frame elapsed-time accounting, and the tick/finish firing
//           loop that notifies an observer and application callbacks.
// Contract: No exceptions/RTTI, no allocations. Single-threaded: Advance(),
//           Start(), Stop(), Reset() and Restart() must be called from the
//           thread that pumps the tick source. Callbacks run inline and must
//           not destroy the timer that invoked them.
// Notes   : A Timer is pinned in memory (no copy/move) because its tick source
//           subscription targets `this`. Destruction cancels the subscription.
//           Advance() does not gate on state; pausing delivery is the tick
//           source's job, driven by Start/Stop/Reset and the finish step.
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"
#include "Core/Contracts/TickSource.hpp"
#include "Core/Timer/TickPolicy.hpp"
#include "Core/Timer/TimerEvent.hpp"
#include "Core/Timer/TimerKind.hpp"
#include "Core/Timer/TimerObserver.hpp"
#include "Core/Timer/TimerState.hpp"

#include <optional>

namespace chr::timer
{
    // Collaborators a timer is configured with. Every member is optional:
    //  - unbound tickSource -> the owner calls Advance() by hand
    //  - unbound clock      -> SystemClock
    //  - null observers     -> observer handles cannot be attached
    struct TimerEnvironment
    {
        time::TickSourceInterface tickSource{};
        time::ClockInterface      clock{};
        ObserverRegistry*         observers = nullptr;
    };

    class Timer
    {
    public:
        Timer() noexcept = default;
        ~Timer() noexcept;

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;
        Timer(Timer&&) = delete;
        Timer& operator=(Timer&&) = delete;

        // One-shot: validates `kind`, subscribes to the tick source (paused)
        // and applies the flavor. On failure nothing is changed.
        [[nodiscard]] TimerConfigStatus Configure(const TimerKind& kind,
                                                  const TimerEnvironment& environment = {}) noexcept;

        // --- State control -------------------------------------------------

        // New/Inactive -> Active. False if not allowed or not configured.
        bool Start() noexcept;
        // Active -> Inactive. Elapsed time is kept.
        bool Stop() noexcept;
        // Any -> New. Clears counters and timestamps; keeps interval,
        // duration, callbacks and custom decisions.
        bool Reset() noexcept;
        // Reset() followed by Start(); notifies didRestart when the start succeeds.
        bool Restart() noexcept;

        // --- Driving --------------------------------------------------------

        // One frame of accounting. Negative or non-finite deltas are ignored.
        void Advance(Seconds deltaTime) noexcept;

        // --- Observer -------------------------------------------------------

        bool SetObserver(ObserverHandle handle) noexcept;
        bool SetObserver(ObserverRegistry& registry, ObserverHandle handle) noexcept;
        void ClearObserver() noexcept { mObserver = ObserverHandle::Invalid(); }
        [[nodiscard]] ObserverHandle GetObserver() const noexcept { return mObserver; }

        // --- Behaviour ------------------------------------------------------

        void SetInterval(std::optional<Seconds> interval) noexcept { mInterval = interval; }
        void SetDuration(std::optional<Seconds> duration) noexcept { mDuration = duration; }
        void SetOnTick(TimerCallback callback) noexcept { mOnTick = callback; }
        void SetOnFinish(TimerCallback callback) noexcept { mOnFinish = callback; }
        void SetCustomShouldTick(TimerDecision decision) noexcept { mCustomShouldTick = decision; }
        void SetCustomShouldFinish(TimerDecision decision) noexcept { mCustomShouldFinish = decision; }

        [[nodiscard]] const std::optional<Seconds>& GetInterval() const noexcept { return mInterval; }
        [[nodiscard]] const std::optional<Seconds>& GetDuration() const noexcept { return mDuration; }
        [[nodiscard]] const TimerCallback& GetOnTick() const noexcept { return mOnTick; }
        [[nodiscard]] const TimerCallback& GetOnFinish() const noexcept { return mOnFinish; }
        [[nodiscard]] const TimerDecision& GetCustomShouldTick() const noexcept { return mCustomShouldTick; }
        [[nodiscard]] const TimerDecision& GetCustomShouldFinish() const noexcept { return mCustomShouldFinish; }

        // --- Data -----------------------------------------------------------

        [[nodiscard]] TimerState GetState() const noexcept { return mState; }
        [[nodiscard]] bool IsConfigured() const noexcept { return mIsConfigured; }
        [[nodiscard]] const TimerKind& GetKind() const noexcept { return mKind; }
        [[nodiscard]] time::TickSubscription GetSubscription() const noexcept { return mSubscription; }

        [[nodiscard]] Seconds GetElapsedTime() const noexcept { return mElapsedTime; }
        [[nodiscard]] Seconds GetElapsedSinceLastTick() const noexcept { return mElapsedSinceLastTick; }
        [[nodiscard]] Seconds GetElapsedSinceLastFinish() const noexcept { return mElapsedSinceLastFinish; }
        [[nodiscard]] const std::optional<Timestamp>& GetTimestampOfLastTick() const noexcept { return mTimestampOfLastTick; }
        [[nodiscard]] const std::optional<Timestamp>& GetTimestampOfLastFinish() const noexcept { return mTimestampOfLastFinish; }
        [[nodiscard]] chr::u64 GetTimesTicked() const noexcept { return mTimesTicked; }
        [[nodiscard]] chr::u64 GetTimesFinished() const noexcept { return mTimesFinished; }

        // Clock sample taken by the advance in progress (or the last one).
        [[nodiscard]] Timestamp GetFrameTimestamp() const noexcept { return mFrameTimestamp; }

    private:
        static void AdvanceFromTickSource(void* target, Seconds deltaTime) noexcept;

        void Tick(Timestamp now) noexcept;
        void Finish(Timestamp now) noexcept;
        void PauseDelivery(bool paused) noexcept;

        void NotifyLifecycle(TimerObserverVTable::LifecycleFunc TimerObserverVTable::* entry) const noexcept;
        void NotifyEvent(TimerObserverVTable::EventFunc TimerObserverVTable::* entry, const TimerEvent& event) const noexcept;

        // Lifecycle
        TimerState mState        = TimerState::New;
        bool       mIsConfigured = false;
        TimerKind  mKind{};

        // Collaborators
        time::TickSourceInterface mTickSource{};
        time::TickSubscription    mSubscription{};
        time::ClockInterface      mClock{};
        ObserverRegistry*         mObservers = nullptr;
        ObserverHandle            mObserver{};

        // Behaviour
        std::optional<Seconds> mInterval{};
        std::optional<Seconds> mDuration{};
        TimerCallback          mOnTick{};
        TimerCallback          mOnFinish{};
        TimerDecision          mCustomShouldTick{};
        TimerDecision          mCustomShouldFinish{};

        // Data
        Seconds                  mElapsedTime            = 0.0;
        Seconds                  mElapsedSinceLastTick   = 0.0;
        Seconds                  mElapsedSinceLastFinish = 0.0;
        std::optional<Timestamp> mTimestampOfLastTick{};
        std::optional<Timestamp> mTimestampOfLastFinish{};
        chr::u64                 mTimesTicked   = 0;
        chr::u64                 mTimesFinished = 0;
        Timestamp                mFrameTimestamp = 0;
    };

    // Interval/duration comparisons against the elapsed-time counters.
    [[nodiscard]] bool ShouldTickByDefault(const Timer& timer) noexcept;
    [[nodiscard]] bool ShouldFinishByDefault(const Timer& timer) noexcept;

    // Custom decision when bound, default rule otherwise.
    [[nodiscard]] bool DecideTick(const Timer& timer) noexcept;
    [[nodiscard]] bool DecideFinish(const Timer& timer) noexcept;

} // namespace chr::timer
