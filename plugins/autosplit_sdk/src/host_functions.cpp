#include "autosplit_sdk/host_functions.hpp"

namespace autosplit_sdk {

HostFunctions::HostFunctions(const AutosplitHostApi& host)
    : m_host(host), m_logger(&host) {}

std::optional<Process> HostFunctions::attach(const std::string& process_name) const {
    uint64_t handle = m_host.process_attach(m_host.context, process_name.data(),
                                            static_cast<uint32_t>(process_name.size()));
    if (handle == 0) {
        return std::nullopt;
    }
    return std::optional<Process>(std::in_place, &m_host, handle);
}

void HostFunctions::start() const {
    m_host.timer_start(m_host.context);
}

void HostFunctions::split() const {
    m_host.timer_split(m_host.context);
}

void HostFunctions::skip_split() const {
    m_host.timer_skip_split(m_host.context);
}

void HostFunctions::undo_split() const {
    m_host.timer_undo_split(m_host.context);
}

void HostFunctions::reset() const {
    m_host.timer_reset(m_host.context);
}

void HostFunctions::pause() const {
    m_host.timer_pause_game_time(m_host.context);
}

void HostFunctions::unpause() const {
    m_host.timer_resume_game_time(m_host.context);
}

void HostFunctions::set_game_time(std::chrono::nanoseconds time) const {
    if (time.count() < 0) {
        time = std::chrono::nanoseconds::zero();
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time);
    auto nanos = time - seconds;
    m_host.timer_set_game_time(m_host.context,
                               static_cast<int64_t>(seconds.count()),
                               static_cast<int32_t>(nanos.count()));
}

TimerState HostFunctions::state() const {
    return timer_state_from_raw(m_host.timer_get_state(m_host.context));
}

void HostFunctions::set_variable(const std::string& key, const std::string& value) const {
    m_host.timer_set_variable(m_host.context,
                              key.data(), static_cast<uint32_t>(key.size()),
                              value.data(), static_cast<uint32_t>(value.size()));
}

void HostFunctions::set_tick_rate(double rate) const {
    m_host.runtime_set_tick_rate(m_host.context, rate);
}

void HostFunctions::print_message(const std::string& message) const {
    m_host.runtime_print_message(m_host.context, message.data(),
                                 static_cast<uint32_t>(message.size()));
}

} // namespace autosplit_sdk
