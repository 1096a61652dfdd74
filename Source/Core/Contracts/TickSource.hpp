// ============================================================================
// Chronos - Source/Core/Contracts/TickSource.hpp
// ----------------------------------------------------------------------------
// Purpose : Tick source contract describing the periodic driver (display link,
//           fixed-rate loop, test pump) that delivers per-frame deltas to
//           subscribed timers.
// Contract: Header-only, no exceptions/RTTI, engine-absolute includes only.
//           All types are POD or trivially copyable; no allocations occur in
//           this layer. Delivery happens on the thread that pumps the backend.
// Notes   : A subscription starts paused. Timers resume it on Start() and
//           pause it on Stop()/Reset()/finish; Cancel() releases it for good.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <concepts>
#include <type_traits>

namespace chr::time
{
    // ------------------------------------------------------------------------
    // Public POD handles
    // ------------------------------------------------------------------------

    struct TickSubscription
    {
        chr::u32 slot       = 0;
        chr::u32 generation = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return generation != 0; }
        [[nodiscard]] static constexpr TickSubscription Invalid() noexcept { return TickSubscription{}; }
    };

    static_assert(std::is_trivially_copyable_v<TickSubscription>);

    // Receiver of advance signals; `target` is typically the subscribing timer.
    struct TickSink
    {
        using AdvanceFunc = void(*)(void* target, Seconds deltaTime) noexcept;

        AdvanceFunc advance = nullptr;
        void*       target  = nullptr;

        [[nodiscard]] constexpr bool IsBound() const noexcept { return advance != nullptr && target != nullptr; }
    };

    static_assert(std::is_trivially_copyable_v<TickSink>);

    struct TickSourceCaps
    {
        bool     fixedRate     = false;
        Seconds  nominalPeriod = 0.0; // 0 when the source follows the host refresh rate.
        chr::u32 maxSubscriptions = 0;
        chr::DeterminismMode  determinism  = chr::DeterminismMode::Unknown;
        chr::ThreadSafetyMode threadSafety = chr::ThreadSafetyMode::Unknown;
    };

    static_assert(std::is_trivially_copyable_v<TickSourceCaps>);

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    struct TickSourceVTable
    {
        using GetCapsFunc   = TickSourceCaps(*)(const void* userData) noexcept;
        using SubscribeFunc = TickSubscription(*)(void* userData, const TickSink& sink) noexcept;
        using SetPausedFunc = void(*)(void* userData, TickSubscription subscription, bool paused) noexcept;
        using CancelFunc    = void(*)(void* userData, TickSubscription subscription) noexcept;

        GetCapsFunc   getCaps   = nullptr;
        SubscribeFunc subscribe = nullptr;
        SetPausedFunc setPaused = nullptr;
        CancelFunc    cancel    = nullptr;
    };

    struct TickSourceInterface
    {
        TickSourceVTable vtable{};
        void*            userData = nullptr; // Non-owning backend instance pointer.
    };

    [[nodiscard]] inline bool IsBound(const TickSourceInterface& source) noexcept
    {
        return source.userData != nullptr &&
               source.vtable.subscribe != nullptr &&
               source.vtable.setPaused != nullptr &&
               source.vtable.cancel != nullptr;
    }

    [[nodiscard]] inline TickSourceCaps QueryCaps(const TickSourceInterface& source) noexcept
    {
        return (source.vtable.getCaps && source.userData)
            ? source.vtable.getCaps(source.userData)
            : TickSourceCaps{};
    }

    [[nodiscard]] inline TickSubscription Subscribe(TickSourceInterface& source, const TickSink& sink) noexcept
    {
        return (source.vtable.subscribe && source.userData)
            ? source.vtable.subscribe(source.userData, sink)
            : TickSubscription::Invalid();
    }

    inline void SetPaused(TickSourceInterface& source, TickSubscription subscription, bool paused) noexcept
    {
        if (source.vtable.setPaused && source.userData && subscription.IsValid())
        {
            source.vtable.setPaused(source.userData, subscription, paused);
        }
    }

    inline void Cancel(TickSourceInterface& source, TickSubscription subscription) noexcept
    {
        if (source.vtable.cancel && source.userData && subscription.IsValid())
        {
            source.vtable.cancel(source.userData, subscription);
        }
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept TickSourceBackend = requires(Backend& backend, const Backend& constBackend, const TickSink& sink, TickSubscription subscription, bool paused)
    {
        { constBackend.GetCaps() } noexcept -> std::same_as<TickSourceCaps>;
        { backend.Subscribe(sink) } noexcept -> std::same_as<TickSubscription>;
        { backend.SetPaused(subscription, paused) } noexcept -> std::same_as<void>;
        { backend.Cancel(subscription) } noexcept -> std::same_as<void>;
    };

    namespace detail
    {
        template <typename Backend>
        struct TickSourceInterfaceAdapter
        {
            static TickSourceCaps GetCaps(const void* userData) noexcept
            {
                return static_cast<const Backend*>(userData)->GetCaps();
            }

            static TickSubscription Subscribe(void* userData, const TickSink& sink) noexcept
            {
                return static_cast<Backend*>(userData)->Subscribe(sink);
            }

            static void SetPaused(void* userData, TickSubscription subscription, bool paused) noexcept
            {
                static_cast<Backend*>(userData)->SetPaused(subscription, paused);
            }

            static void Cancel(void* userData, TickSubscription subscription) noexcept
            {
                static_cast<Backend*>(userData)->Cancel(subscription);
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline TickSourceInterface MakeTickSourceInterface(Backend& backend) noexcept
    {
        static_assert(TickSourceBackend<Backend>, "Backend must satisfy TickSourceBackend concept.");

        TickSourceInterface iface{};
        iface.userData         = &backend;
        iface.vtable.getCaps   = &detail::TickSourceInterfaceAdapter<Backend>::GetCaps;
        iface.vtable.subscribe = &detail::TickSourceInterfaceAdapter<Backend>::Subscribe;
        iface.vtable.setPaused = &detail::TickSourceInterfaceAdapter<Backend>::SetPaused;
        iface.vtable.cancel    = &detail::TickSourceInterfaceAdapter<Backend>::Cancel;
        return iface;
    }

} // namespace chr::time
