#pragma once

#include "autosplit/autosplit_api.hpp"
#include "host_timer.hpp"
#include "simulated_process.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace autosplit {

// Timer actions an autosplitter can request
enum class HostAction {
    Start,
    Split,
    SkipSplit,
    UndoSplit,
    Reset,
    Pause,
    Resume
};

const char* host_action_to_string(HostAction action);

// One action request as the host received it
struct HostActionRecord {
    HostAction action;
    HostTimerState state_before;
    bool applied;           // false when the request was illegal and ignored
};

// Tick rate bounds applied to set_tick_rate requests
struct TickRateLimits {
    double min_rate = 1.0;
    double max_rate = 240.0;
};

// SimulatedHost - An in-memory host for autosplitter modules
// Implements every primitive of AutosplitHostApi over a ProcessTable and a
// HostTimer. Action requests are applied if legal and always recorded, so
// a test can check exactly what a plugin asked for.
class SimulatedHost {
public:
    SimulatedHost();
    ~SimulatedHost() = default;

    // The table holds a pointer back to this host
    SimulatedHost(const SimulatedHost&) = delete;
    SimulatedHost& operator=(const SimulatedHost&) = delete;

    // Binding table to hand to a plugin. Valid as long as this host lives.
    const AutosplitHostApi* api() const { return &m_api; }

    ProcessTable& processes() { return m_processes; }
    const ProcessTable& processes() const { return m_processes; }
    HostTimer& timer() { return m_timer; }
    const HostTimer& timer() const { return m_timer; }

    // ============================================================
    // Raw primitives (what the binding table calls)
    // ============================================================

    void print_message(const std::string& message);
    void set_tick_rate(double rate);

    uint64_t attach(const std::string& name);
    void detach(uint64_t handle);
    uint64_t get_module_address(uint64_t handle, const std::string& name) const;
    bool read(uint64_t handle, uint64_t address, uint8_t* buf, uint32_t len) const;

    void request(HostAction action);
    void set_variable(const std::string& key, const std::string& value);
    void set_game_time(int64_t seconds, int32_t nanos);
    uint32_t get_raw_state() const;

    // ============================================================
    // Inspection
    // ============================================================

    const std::vector<HostActionRecord>& get_action_log() const { return m_action_log; }
    std::vector<HostAction> get_requested_actions() const;
    void clear_action_log() { m_action_log.clear(); }

    const std::map<std::string, std::string>& get_variables() const { return m_variables; }
    std::string get_variable(const std::string& key) const;  // "" if unset
    uint64_t get_variable_write_count() const { return m_variable_writes; }

    double get_tick_rate() const { return m_tick_rate; }
    void set_default_tick_rate(double rate) { m_tick_rate = rate; }
    const TickRateLimits& get_tick_rate_limits() const { return m_tick_limits; }
    void set_tick_rate_limits(const TickRateLimits& limits) { m_tick_limits = limits; }

    const std::vector<std::string>& get_messages() const { return m_messages; }
    void set_echo_messages(bool echo) { m_echo_messages = echo; }

    size_t get_attached_count() const { return m_attachments.size(); }
    uint64_t get_read_count() const { return m_read_count; }
    uint64_t get_detach_count() const { return m_detach_count; }

private:
    void build_api();

    ProcessTable m_processes;
    HostTimer m_timer;
    AutosplitHostApi m_api{};

    // handle -> pid of the attached process
    std::unordered_map<uint64_t, uint64_t> m_attachments;    // handle -> process id
    uint64_t m_next_handle = 1;

    std::vector<HostActionRecord> m_action_log;
    std::map<std::string, std::string> m_variables;
    uint64_t m_variable_writes = 0;

    double m_tick_rate = 60.0;
    TickRateLimits m_tick_limits;

    std::vector<std::string> m_messages;
    bool m_echo_messages = false;

    mutable uint64_t m_read_count = 0;
    uint64_t m_detach_count = 0;
};

} // namespace autosplit
