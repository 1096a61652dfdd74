// ============================================================================
// Chronos - Source/Core/Timer/TimerObserver.hpp
// ----------------------------------------------------------------------------
// Purpose : Observer contract for timer lifecycle and event notifications, and
//           the registry that turns observers into non-owning handles.
// Contract: Header-only, no exceptions/RTTI, no allocations. A timer stores
//           only an ObserverHandle; notifying through a handle whose observer
//           was unregistered is a silent no-op. The registry must outlive
//           every timer holding one of its handles.
// Notes   : Handles carry a generation so a recycled slot never reaches the
//           previous observer. ScopedObserverRegistration ties registration to
//           the observer's own lifetime.
// ============================================================================

#pragma once

#include "Core/Logger.hpp"
#include "Core/Timer/TimerEvent.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

namespace chr::timer
{
    class Timer;

    inline constexpr chr::u32 kObserverRegistryCapacity = 32;

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    // Every entry is optional; unset entries are skipped.
    struct TimerObserverVTable
    {
        using LifecycleFunc = void(*)(void* userData, const Timer& timer) noexcept;
        using EventFunc     = void(*)(void* userData, const TimerEvent& event, const Timer& timer) noexcept;

        LifecycleFunc didStart   = nullptr;
        LifecycleFunc didStop    = nullptr;
        LifecycleFunc didReset   = nullptr;
        LifecycleFunc didRestart = nullptr;
        EventFunc     didTick    = nullptr;
        EventFunc     didFinish  = nullptr;
    };

    struct TimerObserverInterface
    {
        TimerObserverVTable vtable{};
        void*               userData = nullptr; // Non-owning observer instance pointer.
    };

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Observer>
    concept TimerObserverBackend = requires(Observer& observer, const Timer& timer, const TimerEvent& event)
    {
        { observer.DidStart(timer) } noexcept -> std::same_as<void>;
        { observer.DidStop(timer) } noexcept -> std::same_as<void>;
        { observer.DidReset(timer) } noexcept -> std::same_as<void>;
        { observer.DidRestart(timer) } noexcept -> std::same_as<void>;
        { observer.DidTick(event, timer) } noexcept -> std::same_as<void>;
        { observer.DidFinish(event, timer) } noexcept -> std::same_as<void>;
    };

    namespace detail
    {
        template <typename Observer>
        struct TimerObserverAdapter
        {
            static void DidStart(void* userData, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidStart(timer);
            }

            static void DidStop(void* userData, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidStop(timer);
            }

            static void DidReset(void* userData, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidReset(timer);
            }

            static void DidRestart(void* userData, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidRestart(timer);
            }

            static void DidTick(void* userData, const TimerEvent& event, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidTick(event, timer);
            }

            static void DidFinish(void* userData, const TimerEvent& event, const Timer& timer) noexcept
            {
                static_cast<Observer*>(userData)->DidFinish(event, timer);
            }
        };
    } // namespace detail

    template <typename Observer>
    [[nodiscard]] inline TimerObserverInterface MakeTimerObserverInterface(Observer& observer) noexcept
    {
        static_assert(TimerObserverBackend<Observer>, "Observer must satisfy TimerObserverBackend concept.");

        TimerObserverInterface iface{};
        iface.userData          = &observer;
        iface.vtable.didStart   = &detail::TimerObserverAdapter<Observer>::DidStart;
        iface.vtable.didStop    = &detail::TimerObserverAdapter<Observer>::DidStop;
        iface.vtable.didReset   = &detail::TimerObserverAdapter<Observer>::DidReset;
        iface.vtable.didRestart = &detail::TimerObserverAdapter<Observer>::DidRestart;
        iface.vtable.didTick    = &detail::TimerObserverAdapter<Observer>::DidTick;
        iface.vtable.didFinish  = &detail::TimerObserverAdapter<Observer>::DidFinish;
        return iface;
    }

    // ------------------------------------------------------------------------
    // Registry of live observers
    // ------------------------------------------------------------------------

    struct ObserverHandle
    {
        chr::u32 slot       = 0;
        chr::u32 generation = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return generation != 0; }
        [[nodiscard]] static constexpr ObserverHandle Invalid() noexcept { return ObserverHandle{}; }
    };

    static_assert(std::is_trivially_copyable_v<ObserverHandle>);

    struct ObserverRegistry
    {
        struct Entry
        {
            TimerObserverInterface observer{};
            chr::u32               generation = 0;
            bool                   isActive   = false;
        };

        Entry    entries[kObserverRegistryCapacity]{};
        chr::u32 activeCount = 0;

        // Returns an invalid handle when the registry is full or the observer has no userData.
        [[nodiscard]] ObserverHandle Register(const TimerObserverInterface& observer) noexcept
        {
            if (observer.userData == nullptr)
            {
                return ObserverHandle::Invalid();
            }

            for (chr::u32 slot = 0; slot < kObserverRegistryCapacity; ++slot)
            {
                Entry& entry = entries[slot];
                if (entry.isActive)
                {
                    continue;
                }

                if (entry.generation == 0)
                {
                    entry.generation = 1;
                }

                entry.observer = observer;
                entry.isActive = true;
                ++activeCount;
                return ObserverHandle{slot, entry.generation};
            }

            return ObserverHandle::Invalid();
        }

        bool Unregister(ObserverHandle handle) noexcept
        {
            if (Resolve(handle) == nullptr)
            {
                return false;
            }

            CHR_ASSERT(activeCount > 0, "live observer with no registration counted");
            Retire(entries[handle.slot]);
            return true;
        }

        // Retires every registration; generations survive, so old handles stay dead.
        void Clear() noexcept
        {
            for (Entry& entry : entries)
            {
                if (entry.isActive)
                {
                    Retire(entry);
                }
            }
        }

        [[nodiscard]] const TimerObserverInterface* Resolve(ObserverHandle handle) const noexcept
        {
            if (!handle.IsValid() || handle.slot >= kObserverRegistryCapacity)
            {
                return nullptr;
            }

            const Entry& entry = entries[handle.slot];
            return (entry.isActive && entry.generation == handle.generation) ? &entry.observer : nullptr;
        }

        [[nodiscard]] bool IsAlive(ObserverHandle handle) const noexcept
        {
            return Resolve(handle) != nullptr;
        }

    private:
        void Retire(Entry& entry) noexcept
        {
            entry.observer = TimerObserverInterface{};
            entry.isActive = false;
            ++entry.generation;
            if (entry.generation == 0)
            {
                entry.generation = 1;
            }
            --activeCount;
        }
    };

    // RAII registration; embed it in the observer so destroying the observer
    // also retires its handle.
    class ScopedObserverRegistration
    {
    public:
        ScopedObserverRegistration() noexcept = default;

        ScopedObserverRegistration(ObserverRegistry& registry, const TimerObserverInterface& observer) noexcept
            : mRegistry(&registry)
            , mHandle(registry.Register(observer))
        {
        }

        ScopedObserverRegistration(const ScopedObserverRegistration&) = delete;
        ScopedObserverRegistration& operator=(const ScopedObserverRegistration&) = delete;

        ScopedObserverRegistration(ScopedObserverRegistration&& other) noexcept
            : mRegistry(std::exchange(other.mRegistry, nullptr))
            , mHandle(std::exchange(other.mHandle, ObserverHandle::Invalid()))
        {
        }

        ScopedObserverRegistration& operator=(ScopedObserverRegistration&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                mRegistry = std::exchange(other.mRegistry, nullptr);
                mHandle   = std::exchange(other.mHandle, ObserverHandle::Invalid());
            }
            return *this;
        }

        ~ScopedObserverRegistration() noexcept
        {
            Release();
        }

        void Release() noexcept
        {
            if (mRegistry != nullptr && mHandle.IsValid())
            {
                (void)mRegistry->Unregister(mHandle); // False only if already retired.
            }
            mRegistry = nullptr;
            mHandle   = ObserverHandle::Invalid();
        }

        [[nodiscard]] ObserverHandle GetHandle() const noexcept { return mHandle; }
        [[nodiscard]] bool IsActive() const noexcept { return mRegistry != nullptr && mHandle.IsValid(); }

    private:
        ObserverRegistry* mRegistry = nullptr;
        ObserverHandle    mHandle{};
    };

} // namespace chr::timer
