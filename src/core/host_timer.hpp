#pragma once

#include "autosplit/autosplit_api.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace autosplit {

// Host-side timer state. Mirrors AutosplitRawTimerState.
enum class HostTimerState {
    NotRunning,         // Timer has not started
    Running,            // Timer is actively counting
    Paused,             // Game time paused
    Ended               // Run completed
};

const char* host_timer_state_to_string(HostTimerState state);
uint32_t host_timer_state_to_raw(HostTimerState state);

// Callback type for state changes
using TimerStateCallback = std::function<void(HostTimerState from, HostTimerState to)>;

// HostTimer - The host's timer state machine
// Applies action requests when they are legal in the current state and
// ignores them otherwise. Ended stays Ended until reset().
class HostTimer {
public:
    HostTimer();
    ~HostTimer() = default;

    // Timer control. Each returns true when the request changed something.
    bool start();
    bool split();
    bool skip_split();
    bool undo_split();
    bool reset();
    bool pause();
    bool resume();

    // Game time as set by the autosplitter
    void set_game_time(int64_t seconds, int32_t nanos);
    std::chrono::nanoseconds get_game_time() const { return m_game_time; }

    // State queries
    HostTimerState get_state() const { return m_state; }
    int get_current_split_index() const { return m_current_split; }
    int get_total_splits() const;
    uint64_t get_current_time_ms() const;
    int get_attempt_count() const { return m_attempt_count; }
    int get_completed_count() const { return m_completed_count; }

    // Split management. Without names the run is a single segment.
    void set_splits(const std::vector<std::string>& split_names);
    const std::vector<std::string>& get_split_names() const { return m_split_names; }
    const std::vector<uint64_t>& get_split_times() const { return m_split_times; }

    void set_on_state_changed(TimerStateCallback callback) { m_on_state_changed = callback; }

private:
    void set_state(HostTimerState state);
    uint64_t elapsed_since_start_ms() const;

    HostTimerState m_state = HostTimerState::NotRunning;
    std::chrono::steady_clock::time_point m_start_time;
    uint64_t m_accumulated_time_ms = 0;
    std::chrono::nanoseconds m_game_time{0};

    int m_current_split = 0;
    std::vector<std::string> m_split_names;
    std::vector<uint64_t> m_split_times;    // 0 = skipped or not reached

    int m_attempt_count = 0;
    int m_completed_count = 0;

    TimerStateCallback m_on_state_changed;
};

} // namespace autosplit
