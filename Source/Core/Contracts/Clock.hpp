// ============================================================================
// Chronos - Source/Core/Contracts/Clock.hpp
// ----------------------------------------------------------------------------
// Purpose : Clock contract describing backend-agnostic wall-clock sources so
//           timers can stamp events and evaluate schedule windows without
//           depending on a platform clock.
// Contract: Header-only, no exceptions/RTTI, engine-absolute includes only.
//           All types are POD or trivially copyable; no allocations occur in
//           this layer. Thread-safety is left to the backend.
// Notes   : Timestamps are nanoseconds since the Unix epoch. Backends may be
//           synthetic (ManualClock) or platform-backed (SystemClock).
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <concepts>
#include <limits>
#include <type_traits>

namespace chr::time
{
    inline constexpr Timestamp kNanosecondsPerSecond = 1'000'000'000;

    // Sentinels for open-ended schedule windows.
    inline constexpr Timestamp kDistantPast   = std::numeric_limits<Timestamp>::min();
    inline constexpr Timestamp kDistantFuture = std::numeric_limits<Timestamp>::max();

    [[nodiscard]] constexpr Seconds NsToSeconds(Timestamp ns) noexcept
    {
        return static_cast<Seconds>(ns) / static_cast<Seconds>(kNanosecondsPerSecond);
    }

    // Saturates to the window sentinels; NaN maps to zero.
    [[nodiscard]] constexpr Timestamp SecondsToNs(Seconds seconds) noexcept
    {
        const Seconds ns = seconds * static_cast<Seconds>(kNanosecondsPerSecond);
        if (ns != ns)
        {
            return 0;
        }

        // 2^63 is exact in a double; anything at or past it cannot be represented.
        constexpr Seconds kLimit = 9'223'372'036'854'775'808.0;
        if (ns >= kLimit)
        {
            return kDistantFuture;
        }
        if (ns <= -kLimit)
        {
            return kDistantPast;
        }
        return static_cast<Timestamp>(ns);
    }

    [[nodiscard]] constexpr Timestamp AddSaturated(Timestamp base, Timestamp delta) noexcept
    {
        if (delta > 0 && base > kDistantFuture - delta)
        {
            return kDistantFuture;
        }
        if (delta < 0 && base < kDistantPast - delta)
        {
            return kDistantPast;
        }
        return base + delta;
    }

    // ------------------------------------------------------------------------
    // Backend metadata and capabilities
    // ------------------------------------------------------------------------

    struct ClockCaps
    {
        bool monotonic = false;
        bool highRes   = false;
        chr::DeterminismMode  determinism  = chr::DeterminismMode::Unknown;
        chr::ThreadSafetyMode threadSafety = chr::ThreadSafetyMode::Unknown;
    };

    static_assert(std::is_trivially_copyable_v<ClockCaps>);

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    struct ClockVTable
    {
        using GetCapsFunc = ClockCaps(*)(const void* userData) noexcept;
        using NowFunc     = Timestamp(*)(void* userData) noexcept;

        GetCapsFunc getCaps = nullptr;
        NowFunc     now     = nullptr;
    };

    struct ClockInterface
    {
        ClockVTable vtable{};
        void*       userData = nullptr; // Non-owning backend instance pointer.
    };

    [[nodiscard]] inline bool IsBound(const ClockInterface& clock) noexcept
    {
        return clock.vtable.getCaps != nullptr && clock.vtable.now != nullptr && clock.userData != nullptr;
    }

    [[nodiscard]] inline ClockCaps QueryCaps(const ClockInterface& clock) noexcept
    {
        return (clock.vtable.getCaps && clock.userData)
            ? clock.vtable.getCaps(clock.userData)
            : ClockCaps{};
    }

    [[nodiscard]] inline Timestamp NowNs(ClockInterface& clock) noexcept
    {
        return (clock.vtable.now && clock.userData)
            ? clock.vtable.now(clock.userData)
            : Timestamp{0};
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept ClockBackend = requires(Backend& backend, const Backend& constBackend)
    {
        { constBackend.GetCaps() } noexcept -> std::same_as<ClockCaps>;
        { backend.NowNs() } noexcept -> std::same_as<Timestamp>;
    };

    namespace detail
    {
        template <typename Backend>
        struct ClockInterfaceAdapter
        {
            static ClockCaps GetCaps(const void* userData) noexcept
            {
                return static_cast<const Backend*>(userData)->GetCaps();
            }

            static Timestamp Now(void* userData) noexcept
            {
                return static_cast<Backend*>(userData)->NowNs();
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline ClockInterface MakeClockInterface(Backend& backend) noexcept
    {
        static_assert(ClockBackend<Backend>, "Backend must satisfy ClockBackend concept.");

        ClockInterface iface{};
        iface.userData       = &backend;
        iface.vtable.getCaps = &detail::ClockInterfaceAdapter<Backend>::GetCaps;
        iface.vtable.now     = &detail::ClockInterfaceAdapter<Backend>::Now;
        return iface;
    }

} // namespace chr::time
