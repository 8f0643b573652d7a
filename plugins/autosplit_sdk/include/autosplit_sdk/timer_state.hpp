#pragma once

#include <cstdint>

namespace autosplit_sdk {

// Timer state as reported by the host
enum class TimerState : uint8_t {
    NotRunning = 0,     // Timer has not started
    Running = 1,        // Timer is actively counting
    Paused = 2,         // Game time is paused
    Ended = 3           // Run completed, terminal until reset
};

// Convert a raw host value. Values the host should never send map to NotRunning.
inline TimerState timer_state_from_raw(uint32_t raw) {
    switch (raw) {
        case 1:     return TimerState::Running;
        case 2:     return TimerState::Paused;
        case 3:     return TimerState::Ended;
        default:    return TimerState::NotRunning;
    }
}

inline uint32_t timer_state_to_raw(TimerState state) {
    return static_cast<uint32_t>(state);
}

// Convert timer state to string for display/logging
inline const char* timer_state_to_string(TimerState state) {
    switch (state) {
        case TimerState::NotRunning:    return "NotRunning";
        case TimerState::Running:       return "Running";
        case TimerState::Paused:        return "Paused";
        case TimerState::Ended:         return "Ended";
        default:                        return "Unknown";
    }
}

} // namespace autosplit_sdk
