// ============================================================================
// Chronos - Source/Core/Runtime/TimerRuntime.hpp
// ----------------------------------------------------------------------------
// Purpose : Bootstrap the collaborators timers need (clock, frame driver,
//           observer registry) from one config struct, and pump them once per
//           host frame.
// Contract: Header-only, no exceptions/RTTI, no allocations. Init rolls back
//           on failure and leaves the state reset; Shutdown is idempotent.
//           The state owns the built-in backends, so it must outlive every
//           timer configured from MakeTimerEnvironment() and must not move
//           while such timers exist.
// Notes   : Injected clock/tick-source interfaces replace the built-ins, the
//           same way subsystems accept external backends elsewhere.
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"
#include "Core/Contracts/TickSource.hpp"
#include "Core/Logger.hpp"
#include "Core/Time/FrameDriver.hpp"
#include "Core/Time/ManualClock.hpp"
#include "Core/Time/SystemClock.hpp"
#include "Core/Timer/Timer.hpp"
#include "Core/Timer/TimerObserver.hpp"

namespace chr::runtime
{
    enum class TimerRuntimeClock : chr::u8
    {
        System,
        Manual
    };

    enum class TimerRuntimeStatus : chr::u8
    {
        Ok = 0,
        AlreadyInitialized,
        ClockInitFailed,
        TickSourceInitFailed
    };

    enum class TimerRuntimeTickStatus : chr::u8
    {
        Ok = 0,
        NotInitialized,
        ExternalTickSource // Pumping belongs to the injected tick source's owner.
    };

    [[nodiscard]] constexpr const char* ToString(TimerRuntimeStatus status) noexcept
    {
        switch (status)
        {
            case TimerRuntimeStatus::Ok:                   return "Ok";
            case TimerRuntimeStatus::AlreadyInitialized:   return "AlreadyInitialized";
            case TimerRuntimeStatus::ClockInitFailed:      return "ClockInitFailed";
            case TimerRuntimeStatus::TickSourceInitFailed: return "TickSourceInitFailed";
            default:                                       return "Unknown";
        }
    }

    struct TimerRuntimeConfig
    {
        TimerRuntimeClock       clock         = TimerRuntimeClock::System;
        Timestamp               manualStartNs = 0;
        Timestamp               manualStepNs  = 0;
        time::FrameDriverConfig driver{};
        core::LogLevel          logLevel      = core::LogLevel::Info;
    };

    struct TimerRuntimeInjectedInterfaces
    {
        const time::ClockInterface*      clock      = nullptr;
        const time::TickSourceInterface* tickSource = nullptr;
    };

    struct TimerRuntimeState
    {
        time::ClockInterface       clock{};
        time::TickSourceInterface  tickSource{};
        time::ManualClock          manualClock{};
        time::FrameDriver          driver{};
        timer::ObserverRegistry    observers{};
        bool                       usesBuiltInDriver = false;
        bool                       isInitialized     = false;
    };

    struct TimerRuntimeTickResult
    {
        TimerRuntimeTickStatus status    = TimerRuntimeTickStatus::NotInitialized;
        Seconds                deltaTime = 0.0;
        chr::u64               frameIndex = 0;
    };

    [[nodiscard]] inline bool IsInitialized(const TimerRuntimeState& state) noexcept
    {
        return state.isInitialized;
    }

    // Driver slots and registry entries are retired rather than zeroed: their
    // generations carry over, so handles held by timers that outlive the
    // runtime never resolve against a later Init.
    inline void ShutdownTimerRuntime(TimerRuntimeState& state) noexcept
    {
        if (state.isInitialized)
        {
            const chr::u32 live = state.driver.GetStats().activeSubscriptions;
            if (live > 0)
            {
                CHR_LOG_WARNING("Runtime", "Shutdown retired {} live subscriptions", live);
            }
            CHR_LOG_VERBOSE("Runtime", "Shutdown ({} observers)", state.observers.activeCount);
        }

        state.driver.Reset();
        state.observers.Clear();
        state.clock             = time::ClockInterface{};
        state.tickSource        = time::TickSourceInterface{};
        state.manualClock       = time::ManualClock{};
        state.usesBuiltInDriver = false;
        state.isInitialized     = false;
    }

    [[nodiscard]] inline TimerRuntimeStatus InitTimerRuntime(TimerRuntimeState& state,
                                                             const TimerRuntimeConfig& config = {},
                                                             const TimerRuntimeInjectedInterfaces& injected = {}) noexcept
    {
        if (state.isInitialized)
        {
            return TimerRuntimeStatus::AlreadyInitialized;
        }

        ShutdownTimerRuntime(state);
        core::Logger::SetMinLevel(config.logLevel);

        if (injected.clock != nullptr)
        {
            state.clock = *injected.clock;
        }
        else if (config.clock == TimerRuntimeClock::Manual)
        {
            state.manualClock.currentNs = config.manualStartNs;
            state.manualClock.stepNs    = config.manualStepNs;
            state.clock = time::MakeManualClockInterface(state.manualClock);
        }
        else
        {
            state.clock = time::MakeSystemClockInterface();
        }

        if (!time::IsBound(state.clock))
        {
            CHR_LOG_ERROR("Runtime", "Init failed: {}", ToString(TimerRuntimeStatus::ClockInitFailed));
            ShutdownTimerRuntime(state);
            return TimerRuntimeStatus::ClockInitFailed;
        }

        if (injected.tickSource != nullptr)
        {
            state.tickSource        = *injected.tickSource;
            state.usesBuiltInDriver = false;
        }
        else
        {
            state.driver.config     = config.driver;
            state.tickSource        = time::MakeFrameDriverInterface(state.driver);
            state.usesBuiltInDriver = true;
        }

        if (!time::IsBound(state.tickSource))
        {
            CHR_LOG_ERROR("Runtime", "Init failed: {}", ToString(TimerRuntimeStatus::TickSourceInitFailed));
            ShutdownTimerRuntime(state);
            return TimerRuntimeStatus::TickSourceInitFailed;
        }

        state.isInitialized = true;
        CHR_LOG_VERBOSE("Runtime", "Initialized (built-in driver: {})", state.usesBuiltInDriver);
        return TimerRuntimeStatus::Ok;
    }

    // Pumps the built-in driver once, measuring the delta from the runtime clock.
    [[nodiscard]] inline TimerRuntimeTickResult TickTimerRuntime(TimerRuntimeState& state) noexcept
    {
        TimerRuntimeTickResult result{};
        if (!state.isInitialized)
        {
            return result;
        }

        if (!state.usesBuiltInDriver)
        {
            result.status = TimerRuntimeTickStatus::ExternalTickSource;
            return result;
        }

        result.deltaTime  = state.driver.PumpFromClock(state.clock);
        result.frameIndex = state.driver.GetStats().pumps;
        result.status     = TimerRuntimeTickStatus::Ok;
        return result;
    }

    // Pumps the built-in driver with a caller-measured delta.
    [[nodiscard]] inline TimerRuntimeTickResult TickTimerRuntimeWithDelta(TimerRuntimeState& state, Seconds deltaTime) noexcept
    {
        TimerRuntimeTickResult result{};
        if (!state.isInitialized)
        {
            return result;
        }

        if (!state.usesBuiltInDriver)
        {
            result.status = TimerRuntimeTickStatus::ExternalTickSource;
            return result;
        }

        state.driver.Pump(deltaTime);
        result.deltaTime  = deltaTime;
        result.frameIndex = state.driver.GetStats().pumps;
        result.status     = TimerRuntimeTickStatus::Ok;
        return result;
    }

    [[nodiscard]] inline timer::TimerEnvironment MakeTimerEnvironment(TimerRuntimeState& state) noexcept
    {
        timer::TimerEnvironment environment{};
        if (!state.isInitialized)
        {
            return environment;
        }

        environment.tickSource = state.tickSource;
        environment.clock      = state.clock;
        environment.observers  = &state.observers;
        return environment;
    }

    class TimerRuntimeScope
    {
    public:
        explicit TimerRuntimeScope(TimerRuntimeState& state,
                                   const TimerRuntimeConfig& config = {},
                                   const TimerRuntimeInjectedInterfaces& injected = {}) noexcept
            : mState(&state)
        {
            const bool wasInitialized = state.isInitialized;
            mStatus = InitTimerRuntime(state, config, injected);
            mOwnsLifetime = (!wasInitialized && mStatus == TimerRuntimeStatus::Ok);
        }

        TimerRuntimeScope(const TimerRuntimeScope&) = delete;
        TimerRuntimeScope& operator=(const TimerRuntimeScope&) = delete;
        TimerRuntimeScope(TimerRuntimeScope&&) = delete;
        TimerRuntimeScope& operator=(TimerRuntimeScope&&) = delete;

        ~TimerRuntimeScope() noexcept
        {
            if (mOwnsLifetime && mState != nullptr)
            {
                ShutdownTimerRuntime(*mState);
            }
        }

        [[nodiscard]] TimerRuntimeStatus GetStatus() const noexcept { return mStatus; }
        [[nodiscard]] bool OwnsLifetime() const noexcept { return mOwnsLifetime; }

    private:
        TimerRuntimeState*  mState = nullptr;
        TimerRuntimeStatus  mStatus = TimerRuntimeStatus::Ok;
        bool                mOwnsLifetime = false;
    };

} // namespace chr::runtime
