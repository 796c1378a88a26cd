#pragma once
#include <chrono>

namespace shift_roster
{
    // Returns current time in milliseconds since epoch
    static inline long long NowMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
                   steady_clock::now().time_since_epoch())
            .count();
    }

} // namespace shift_roster
