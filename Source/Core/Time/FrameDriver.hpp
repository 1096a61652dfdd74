// ============================================================================
// Chronos - Source/Core/Time/FrameDriver.hpp
// ----------------------------------------------------------------------------
// Purpose : Reference tick source that fans one per-frame delta out to every
//           subscribed timer. Hosts call Pump()/PumpFromClock() once per frame
//           from their main loop (or display-link callback).
// Contract: Header-only, no exceptions/RTTI, no allocations. Fixed-capacity
//           subscription table with generation-checked handles. Not
//           thread-safe; pump, subscribe and cancel from one thread.
// Notes   : Subscriptions created while a pump is in flight are armed when
//           that pump ends, so a sink never sees the frame it was born in.
//           Pause/cancel issued from inside a sink take effect immediately.
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"
#include "Core/Contracts/TickSource.hpp"
#include "Core/Logger.hpp"

namespace chr::time
{
    inline constexpr chr::u32 kFrameDriverMaxSubscriptions = 64;

    struct FrameDriverConfig
    {
        Seconds fixedDeltaSeconds = 0.0; // > 0 makes PumpFromClock() step by this amount instead of measuring.
    };

    struct FrameDriverSlot
    {
        TickSink sink{};
        chr::u32 generation = 0;
        bool     isActive   = false;
        bool     isPaused   = true;
        bool     isArmed    = false;
    };

    static_assert(std::is_trivially_copyable_v<FrameDriverSlot>);

    struct FrameDriver
    {
        struct Stats
        {
            chr::u64 pumps               = 0;
            chr::u64 deliveries          = 0;
            chr::u32 activeSubscriptions = 0;
        } stats{};

        FrameDriverConfig config{};
        FrameDriverSlot   slots[kFrameDriverMaxSubscriptions]{};
        Timestamp         lastSampleNs = 0;
        bool              hasSample    = false;
        bool              isPumping    = false;

        [[nodiscard]] constexpr TickSourceCaps GetCaps() const noexcept
        {
            TickSourceCaps caps{};
            caps.fixedRate        = config.fixedDeltaSeconds > 0.0;
            caps.nominalPeriod    = caps.fixedRate ? config.fixedDeltaSeconds : 0.0;
            caps.maxSubscriptions = kFrameDriverMaxSubscriptions;
            caps.determinism      = caps.fixedRate ? chr::DeterminismMode::Replay : chr::DeterminismMode::Off;
            caps.threadSafety     = chr::ThreadSafetyMode::ExternalSync;
            return caps;
        }

        [[nodiscard]] TickSubscription Subscribe(const TickSink& sink) noexcept
        {
            if (!sink.IsBound())
            {
                CHR_LOG_WARNING("Driver", "Subscribe rejected: sink is not bound");
                return TickSubscription::Invalid();
            }

            for (chr::u32 slotIndex = 0; slotIndex < kFrameDriverMaxSubscriptions; ++slotIndex)
            {
                FrameDriverSlot& slot = slots[slotIndex];
                if (slot.isActive)
                {
                    continue;
                }

                if (slot.generation == 0)
                {
                    slot.generation = 1;
                }

                slot.sink     = sink;
                slot.isActive = true;
                slot.isPaused = true;
                slot.isArmed  = !isPumping;
                ++stats.activeSubscriptions;
                return TickSubscription{slotIndex, slot.generation};
            }

            CHR_LOG_ERROR("Driver", "Subscribe failed: all {} subscription slots in use", kFrameDriverMaxSubscriptions);
            return TickSubscription::Invalid();
        }

        void SetPaused(TickSubscription subscription, bool paused) noexcept
        {
            if (FrameDriverSlot* slot = Resolve(subscription))
            {
                slot->isPaused = paused;
            }
        }

        void Cancel(TickSubscription subscription) noexcept
        {
            FrameDriverSlot* slot = Resolve(subscription);
            if (slot == nullptr)
            {
                return;
            }

            CHR_ASSERT(stats.activeSubscriptions > 0, "live slot with no subscription counted");
            Release(*slot);
        }

        // Cancels every live subscription and clears stats and clock sampling.
        // Slot generations survive, so handles issued before the reset stay dead.
        void Reset() noexcept
        {
            for (FrameDriverSlot& slot : slots)
            {
                if (slot.isActive)
                {
                    Release(slot);
                }
            }

            CHR_ASSERT(stats.activeSubscriptions == 0);
            stats = Stats{};
            config = FrameDriverConfig{};
            ResetClockSample();
        }

        [[nodiscard]] bool IsSubscribed(TickSubscription subscription) const noexcept
        {
            return Resolve(subscription) != nullptr;
        }

        [[nodiscard]] bool IsPaused(TickSubscription subscription) const noexcept
        {
            const FrameDriverSlot* slot = Resolve(subscription);
            return slot == nullptr || slot->isPaused;
        }

        // Delivers `deltaTime` to every armed, running subscription in slot order.
        void Pump(Seconds deltaTime) noexcept
        {
            ++stats.pumps;
            isPumping = true;

            for (FrameDriverSlot& slot : slots)
            {
                if (!slot.isActive || slot.isPaused || !slot.isArmed)
                {
                    continue;
                }

                const TickSink sink = slot.sink;
                sink.advance(sink.target, deltaTime);
                ++stats.deliveries;
            }

            isPumping = false;
            for (FrameDriverSlot& slot : slots)
            {
                if (slot.isActive)
                {
                    slot.isArmed = true;
                }
            }
        }

        // Samples the clock, derives the frame delta and pumps it. The first
        // sample primes the driver and yields a zero delta; a clock stepping
        // backwards also yields zero.
        Seconds PumpFromClock(ClockInterface& clock) noexcept
        {
            const Timestamp nowNs = NowNs(clock);

            Seconds deltaTime = 0.0;
            if (config.fixedDeltaSeconds > 0.0)
            {
                deltaTime = config.fixedDeltaSeconds;
            }
            else if (hasSample && nowNs >= lastSampleNs)
            {
                deltaTime = NsToSeconds(nowNs - lastSampleNs);
            }

            lastSampleNs = nowNs;
            hasSample    = true;

            Pump(deltaTime);
            return deltaTime;
        }

        void ResetClockSample() noexcept
        {
            hasSample    = false;
            lastSampleNs = 0;
        }

        [[nodiscard]] constexpr const Stats& GetStats() const noexcept
        {
            return stats;
        }

    private:
        void Release(FrameDriverSlot& slot) noexcept
        {
            slot.sink     = TickSink{};
            slot.isActive = false;
            slot.isPaused = true;
            slot.isArmed  = false;
            ++slot.generation;
            if (slot.generation == 0)
            {
                slot.generation = 1;
            }
            --stats.activeSubscriptions;
        }

        [[nodiscard]] FrameDriverSlot* Resolve(TickSubscription subscription) noexcept
        {
            if (!subscription.IsValid() || subscription.slot >= kFrameDriverMaxSubscriptions)
            {
                return nullptr;
            }

            FrameDriverSlot& slot = slots[subscription.slot];
            return (slot.isActive && slot.generation == subscription.generation) ? &slot : nullptr;
        }

        [[nodiscard]] const FrameDriverSlot* Resolve(TickSubscription subscription) const noexcept
        {
            return const_cast<FrameDriver*>(this)->Resolve(subscription);
        }
    };

    static_assert(TickSourceBackend<FrameDriver>, "FrameDriver must satisfy tick source backend concept.");

    [[nodiscard]] inline TickSourceInterface MakeFrameDriverInterface(FrameDriver& backend) noexcept
    {
        return MakeTickSourceInterface(backend);
    }

} // namespace chr::time
