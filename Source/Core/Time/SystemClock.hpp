// ============================================================================
// Chronos - Source/Core/Time/SystemClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Platform wall-clock backend built on std::chrono::system_clock.
// Contract: Header-only, no exceptions/RTTI, no allocations. Stateless, so a
//           single process-wide instance is shared by every interface.
// Notes   : Wall time may jump (NTP, user changes); consumers measuring frame
//           deltas must clamp backwards steps.
// ============================================================================

#pragma once

#include "Core/Contracts/Clock.hpp"

#include <chrono>

namespace chr::time
{
    struct SystemClock
    {
        [[nodiscard]] constexpr ClockCaps GetCaps() const noexcept
        {
            ClockCaps caps{};
            caps.monotonic    = false;
            caps.highRes      = true;
            caps.determinism  = chr::DeterminismMode::Off;
            caps.threadSafety = chr::ThreadSafetyMode::ThreadSafe;
            return caps;
        }

        [[nodiscard]] Timestamp NowNs() noexcept
        {
            const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<Timestamp>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch).count());
        }
    };

    static_assert(ClockBackend<SystemClock>, "SystemClock must satisfy clock backend concept.");

    [[nodiscard]] inline ClockInterface MakeSystemClockInterface() noexcept
    {
        static SystemClock sClock{};
        return MakeClockInterface(sClock);
    }

} // namespace chr::time
