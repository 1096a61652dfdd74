// ============================================================================
// Chronos - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs all smoke helpers.
// Contract: No exceptions/RTTI; deterministic ordering; returns 0 on success.
// Notes   : Assumes Run*Smoke helpers are linked from their respective TUs.
//           A failing smoke reports its name and the code of the first
//           check that failed.
// ============================================================================

#include "Core/Logger.hpp"

int RunTimerStateSmoke();
int RunTickPolicySmoke();
int RunTimerKindSmoke();
int RunTimerSmoke();
int RunTimerObserverSmoke();
int RunClockSmoke();
int RunFrameDriverSmoke();
int RunTimerRuntimeSmoke();

namespace
{
    struct SmokeEntry
    {
        const char* name;
        int (*run)();
    };

    constexpr SmokeEntry kSmokes[] = {
        {"TimerState",    &RunTimerStateSmoke},
        {"TickPolicy",    &RunTickPolicySmoke},
        {"TimerKind",     &RunTimerKindSmoke},
        {"Timer",         &RunTimerSmoke},
        {"TimerObserver", &RunTimerObserverSmoke},
        {"Clock",         &RunClockSmoke},
        {"FrameDriver",   &RunFrameDriverSmoke},
        {"TimerRuntime",  &RunTimerRuntimeSmoke},
    };
}

int main()
{
    int failures = 0;

    // Each smoke returns 0 on pass, non-zero on failure.
    for (const SmokeEntry& smoke : kSmokes)
    {
        const int code = smoke.run();
        if (code != 0)
        {
            CHR_LOG_ERROR("Smokes", "{} smoke failed with code {}", smoke.name, code);
            ++failures;
        }
    }

    if (failures == 0)
    {
        CHR_LOG_INFO("Smokes", "All {} smokes passed", sizeof(kSmokes) / sizeof(kSmokes[0]));
    }

    return (failures == 0) ? 0 : 1;
}
