#pragma once

#include "autosplit/autosplit_api.hpp"
#include "autosplit_sdk/logger.hpp"
#include "autosplit_sdk/process.hpp"
#include "autosplit_sdk/timer_state.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace autosplit_sdk {

// HostFunctions - What an autosplitter may ask of the host
// Built once from the binding table the host passes at construct time and
// handed by reference to the splitter on every tick.
//
// Timer actions are one-way requests. Nothing is validated here: asking to
// pause while the timer is not running is forwarded as-is and the host
// decides whether it means anything. Check state() first if that matters.
class HostFunctions {
public:
    explicit HostFunctions(const AutosplitHostApi& host);

    HostFunctions(const HostFunctions&) = delete;
    HostFunctions& operator=(const HostFunctions&) = delete;

    // ============================================================
    // Processes
    // ============================================================

    // Attach to a process running on the same machine by name.
    // Returns nullopt when no process, or more than one, has that name.
    std::optional<Process> attach(const std::string& process_name) const;

    // ============================================================
    // Timer control
    // ============================================================

    // Start the timer. Ignored by the host unless the timer is not running;
    // to begin a new run call reset() and then start().
    void start() const;

    // Mark the current split as finished and move to the next one
    void split() const;

    // Skip the current split without a time
    void skip_split() const;

    // Return to the previous split
    void undo_split() const;

    // Reset the run. Be conservative: only do this on an unambiguous signal
    // that the player abandoned the run.
    void reset() const;

    // Pause the game time counter (loading screens, end-of-level screens)
    void pause() const;

    // Resume the game time counter
    void unpause() const;

    // Set the game time shown by the host. Negative durations count as zero.
    void set_game_time(std::chrono::nanoseconds time) const;

    // Current timer state. Use this to notice manual pauses and resets.
    TimerState state() const;

    // ============================================================
    // Runtime configuration
    // ============================================================

    // Set a variable the host can display (death counter, current level).
    // Last write wins.
    void set_variable(const std::string& key, const std::string& value) const;

    // Ask the host to call update() `rate` times per second. Advisory only.
    void set_tick_rate(double rate) const;

    // Print a raw line in the host's log
    void print_message(const std::string& message) const;

    // Level-filtered logging through print_message
    Logger& logger() { return m_logger; }
    const Logger& logger() const { return m_logger; }

    const AutosplitHostApi& bindings() const { return m_host; }

private:
    const AutosplitHostApi& m_host;
    Logger m_logger;
};

} // namespace autosplit_sdk
