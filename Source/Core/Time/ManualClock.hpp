// ============================================================================
// Chronos - Source/Core/Time/ManualClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Deterministic clock backend that satisfies the clock contract
//           without touching platform time. Useful for tests, replays and CI.
// Contract: Header-only, no exceptions/RTTI, no allocations. All methods are
//           noexcept and deterministic.
// Notes   : `stepNs` is added after every NowNs() sample so a driver polling
//           the clock observes progress; leave it at zero for a frozen clock
//           moved only through Set()/AdvanceBy().
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"

namespace chr::time
{
    struct ManualClock
    {
        Timestamp currentNs = 0;
        Timestamp stepNs    = 0;

        [[nodiscard]] constexpr ClockCaps GetCaps() const noexcept
        {
            ClockCaps caps{};
            caps.monotonic    = false; // Set() may move backwards.
            caps.highRes      = true;
            caps.determinism  = chr::DeterminismMode::Replay;
            caps.threadSafety = chr::ThreadSafetyMode::ExternalSync;
            return caps;
        }

        [[nodiscard]] Timestamp NowNs() noexcept
        {
            const Timestamp sample = currentNs;
            currentNs = AddSaturated(currentNs, stepNs);
            return sample;
        }

        void Set(Timestamp ns) noexcept { currentNs = ns; }
        void AdvanceBy(Timestamp ns) noexcept { currentNs = AddSaturated(currentNs, ns); }
        void AdvanceBySeconds(Seconds seconds) noexcept { AdvanceBy(SecondsToNs(seconds)); }
    };

    static_assert(ClockBackend<ManualClock>, "ManualClock must satisfy clock backend concept.");

    [[nodiscard]] inline ClockInterface MakeManualClockInterface(ManualClock& backend) noexcept
    {
        return MakeClockInterface(backend);
    }

} // namespace chr::time
