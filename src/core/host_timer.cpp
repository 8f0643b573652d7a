#include "host_timer.hpp"
#include <algorithm>

namespace autosplit {

const char* host_timer_state_to_string(HostTimerState state) {
    switch (state) {
        case HostTimerState::NotRunning:    return "NotRunning";
        case HostTimerState::Running:       return "Running";
        case HostTimerState::Paused:        return "Paused";
        case HostTimerState::Ended:         return "Ended";
        default:                            return "Unknown";
    }
}

uint32_t host_timer_state_to_raw(HostTimerState state) {
    switch (state) {
        case HostTimerState::NotRunning:    return AUTOSPLIT_TIMER_NOT_RUNNING;
        case HostTimerState::Running:       return AUTOSPLIT_TIMER_RUNNING;
        case HostTimerState::Paused:        return AUTOSPLIT_TIMER_PAUSED;
        case HostTimerState::Ended:         return AUTOSPLIT_TIMER_ENDED;
        default:                            return AUTOSPLIT_TIMER_NOT_RUNNING;
    }
}

HostTimer::HostTimer() {
    m_split_times.assign(get_total_splits(), 0);
}

void HostTimer::set_state(HostTimerState state) {
    if (state == m_state) return;
    HostTimerState from = m_state;
    m_state = state;
    if (m_on_state_changed) {
        m_on_state_changed(from, state);
    }
}

uint64_t HostTimer::elapsed_since_start_ms() const {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now - m_start_time).count());
}

bool HostTimer::start() {
    if (m_state != HostTimerState::NotRunning) return false;

    m_start_time = std::chrono::steady_clock::now();
    m_accumulated_time_ms = 0;
    m_game_time = std::chrono::nanoseconds::zero();
    m_current_split = 0;
    std::fill(m_split_times.begin(), m_split_times.end(), 0);
    m_attempt_count++;

    set_state(HostTimerState::Running);
    return true;
}

bool HostTimer::split() {
    if (m_state != HostTimerState::Running && m_state != HostTimerState::Paused) return false;
    if (m_current_split >= get_total_splits()) return false;

    m_split_times[m_current_split] = get_current_time_ms();
    m_current_split++;

    // Completing the last split ends the run
    if (m_current_split >= get_total_splits()) {
        if (m_state == HostTimerState::Running) {
            m_accumulated_time_ms += elapsed_since_start_ms();
        }
        m_completed_count++;
        set_state(HostTimerState::Ended);
    }
    return true;
}

bool HostTimer::skip_split() {
    if (m_state != HostTimerState::Running && m_state != HostTimerState::Paused) return false;
    // The last split can only be completed, never skipped
    if (m_current_split >= get_total_splits() - 1) return false;

    m_split_times[m_current_split] = 0;
    m_current_split++;
    return true;
}

bool HostTimer::undo_split() {
    if (m_state == HostTimerState::NotRunning) return false;
    if (m_current_split <= 0) return false;

    m_current_split--;
    m_split_times[m_current_split] = 0;

    // If we were finished, go back to running
    if (m_state == HostTimerState::Ended) {
        m_completed_count--;
        m_start_time = std::chrono::steady_clock::now();
        set_state(HostTimerState::Running);
    }
    return true;
}

bool HostTimer::reset() {
    bool changed = m_state != HostTimerState::NotRunning || m_current_split != 0;

    m_accumulated_time_ms = 0;
    m_game_time = std::chrono::nanoseconds::zero();
    m_current_split = 0;
    std::fill(m_split_times.begin(), m_split_times.end(), 0);

    set_state(HostTimerState::NotRunning);
    return changed;
}

bool HostTimer::pause() {
    if (m_state != HostTimerState::Running) return false;

    m_accumulated_time_ms += elapsed_since_start_ms();
    set_state(HostTimerState::Paused);
    return true;
}

bool HostTimer::resume() {
    if (m_state != HostTimerState::Paused) return false;

    m_start_time = std::chrono::steady_clock::now();
    set_state(HostTimerState::Running);
    return true;
}

void HostTimer::set_game_time(int64_t seconds, int32_t nanos) {
    m_game_time = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
}

int HostTimer::get_total_splits() const {
    return std::max(1, static_cast<int>(m_split_names.size()));
}

uint64_t HostTimer::get_current_time_ms() const {
    if (m_state == HostTimerState::Running) {
        return m_accumulated_time_ms + elapsed_since_start_ms();
    }
    return m_accumulated_time_ms;
}

void HostTimer::set_splits(const std::vector<std::string>& split_names) {
    m_split_names = split_names;
    m_split_times.assign(get_total_splits(), 0);
    m_current_split = 0;
}

} // namespace autosplit
