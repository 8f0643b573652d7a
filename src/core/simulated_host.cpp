#include "simulated_host.hpp"

#include <cmath>
#include <iostream>

namespace autosplit {

namespace {

SimulatedHost* host_from(void* ctx) {
    return static_cast<SimulatedHost*>(ctx);
}

std::string make_string(const char* data, uint32_t len) {
    return data ? std::string(data, len) : std::string();
}

} // anonymous namespace

const char* host_action_to_string(HostAction action) {
    switch (action) {
        case HostAction::Start:         return "start";
        case HostAction::Split:         return "split";
        case HostAction::SkipSplit:     return "skip_split";
        case HostAction::UndoSplit:     return "undo_split";
        case HostAction::Reset:         return "reset";
        case HostAction::Pause:         return "pause";
        case HostAction::Resume:        return "resume";
        default:                        return "unknown";
    }
}

SimulatedHost::SimulatedHost() {
    build_api();
}

void SimulatedHost::build_api() {
    m_api.api_version = AUTOSPLIT_API_VERSION;
    m_api.context = this;

    m_api.runtime_print_message = [](void* ctx, const char* text, uint32_t len) {
        host_from(ctx)->print_message(make_string(text, len));
    };
    m_api.runtime_set_tick_rate = [](void* ctx, double rate) {
        host_from(ctx)->set_tick_rate(rate);
    };
    m_api.process_attach = [](void* ctx, const char* name, uint32_t len) -> uint64_t {
        return host_from(ctx)->attach(make_string(name, len));
    };
    m_api.process_detach = [](void* ctx, uint64_t process) {
        host_from(ctx)->detach(process);
    };
    m_api.process_get_module_address = [](void* ctx, uint64_t process,
                                          const char* name, uint32_t len) -> uint64_t {
        return host_from(ctx)->get_module_address(process, make_string(name, len));
    };
    m_api.process_read = [](void* ctx, uint64_t process, uint64_t address,
                            uint8_t* buf, uint32_t len) -> uint32_t {
        return host_from(ctx)->read(process, address, buf, len) ? 1 : 0;
    };
    m_api.timer_start = [](void* ctx) { host_from(ctx)->request(HostAction::Start); };
    m_api.timer_split = [](void* ctx) { host_from(ctx)->request(HostAction::Split); };
    m_api.timer_skip_split = [](void* ctx) { host_from(ctx)->request(HostAction::SkipSplit); };
    m_api.timer_undo_split = [](void* ctx) { host_from(ctx)->request(HostAction::UndoSplit); };
    m_api.timer_reset = [](void* ctx) { host_from(ctx)->request(HostAction::Reset); };
    m_api.timer_pause_game_time = [](void* ctx) { host_from(ctx)->request(HostAction::Pause); };
    m_api.timer_resume_game_time = [](void* ctx) { host_from(ctx)->request(HostAction::Resume); };
    m_api.timer_set_variable = [](void* ctx, const char* key, uint32_t key_len,
                                  const char* value, uint32_t value_len) {
        host_from(ctx)->set_variable(make_string(key, key_len), make_string(value, value_len));
    };
    m_api.timer_set_game_time = [](void* ctx, int64_t seconds, int32_t nanos) {
        host_from(ctx)->set_game_time(seconds, nanos);
    };
    m_api.timer_get_state = [](void* ctx) -> uint32_t {
        return host_from(ctx)->get_raw_state();
    };
}

void SimulatedHost::print_message(const std::string& message) {
    m_messages.push_back(message);
    if (m_echo_messages) {
        std::cout << "[Plugin] " << message << std::endl;
    }
}

void SimulatedHost::set_tick_rate(double rate) {
    if (!std::isfinite(rate) || rate <= 0.0) {
        std::cerr << "[SimulatedHost] Ignoring invalid tick rate: " << rate << std::endl;
        return;
    }
    if (rate < m_tick_limits.min_rate) rate = m_tick_limits.min_rate;
    if (rate > m_tick_limits.max_rate) rate = m_tick_limits.max_rate;
    m_tick_rate = rate;
}

uint64_t SimulatedHost::attach(const std::string& name) {
    SimulatedProcess* process = m_processes.find_unique(name);
    if (!process) {
        return 0;
    }

    uint64_t handle = m_next_handle++;
    m_attachments[handle] = process->get_id();
    std::cout << "[SimulatedHost] Attached to " << name
              << " (pid " << process->get_pid() << ")" << std::endl;
    return handle;
}

void SimulatedHost::detach(uint64_t handle) {
    auto it = m_attachments.find(handle);
    if (it == m_attachments.end()) {
        std::cerr << "[SimulatedHost] Detach of unknown process handle " << handle << std::endl;
        return;
    }
    m_attachments.erase(it);
    m_detach_count++;
}

uint64_t SimulatedHost::get_module_address(uint64_t handle, const std::string& name) const {
    auto it = m_attachments.find(handle);
    if (it == m_attachments.end()) return 0;

    const SimulatedProcess* process = m_processes.find_by_id(it->second);
    if (!process || !process->is_alive()) return 0;
    return process->get_module_address(name);
}

bool SimulatedHost::read(uint64_t handle, uint64_t address, uint8_t* buf, uint32_t len) const {
    m_read_count++;

    auto it = m_attachments.find(handle);
    if (it == m_attachments.end() || !buf) return false;

    // The process may have been removed since attach
    const SimulatedProcess* process = m_processes.find_by_id(it->second);
    if (!process) return false;

    return process->read(address, buf, len);
}

void SimulatedHost::request(HostAction action) {
    HostActionRecord record;
    record.action = action;
    record.state_before = m_timer.get_state();

    switch (action) {
        case HostAction::Start:         record.applied = m_timer.start(); break;
        case HostAction::Split:         record.applied = m_timer.split(); break;
        case HostAction::SkipSplit:     record.applied = m_timer.skip_split(); break;
        case HostAction::UndoSplit:     record.applied = m_timer.undo_split(); break;
        case HostAction::Reset:         record.applied = m_timer.reset(); break;
        case HostAction::Pause:         record.applied = m_timer.pause(); break;
        case HostAction::Resume:        record.applied = m_timer.resume(); break;
        default:                        record.applied = false; break;
    }

    m_action_log.push_back(record);
}

std::vector<HostAction> SimulatedHost::get_requested_actions() const {
    std::vector<HostAction> actions;
    actions.reserve(m_action_log.size());
    for (const auto& record : m_action_log) {
        actions.push_back(record.action);
    }
    return actions;
}

void SimulatedHost::set_variable(const std::string& key, const std::string& value) {
    m_variables[key] = value;
    m_variable_writes++;
}

std::string SimulatedHost::get_variable(const std::string& key) const {
    auto it = m_variables.find(key);
    return it != m_variables.end() ? it->second : "";
}

void SimulatedHost::set_game_time(int64_t seconds, int32_t nanos) {
    m_timer.set_game_time(seconds, nanos);
}

uint32_t SimulatedHost::get_raw_state() const {
    return host_timer_state_to_raw(m_timer.get_state());
}

} // namespace autosplit
