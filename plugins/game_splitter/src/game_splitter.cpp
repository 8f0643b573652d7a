#include "game_splitter.hpp"
#include <string>

namespace game_splitter {

using autosplit_sdk::Address;
using autosplit_sdk::HostFunctions;
using autosplit_sdk::TimerState;

GameSplitter::GameSplitter(HostFunctions& host) {
    host.set_tick_rate(TICK_RATE);
    try_attach(host);
}

bool GameSplitter::try_attach(HostFunctions& host) {
    m_process = host.attach(PROCESS_NAME);
    if (m_process) {
        host.logger().info(std::string("attached to ") + PROCESS_NAME);
        host.set_variable("attached", "yes");
    } else {
        host.set_variable("attached", "no");
    }
    return m_process.has_value();
}

void GameSplitter::update(HostFunctions& host) {
    if (!m_process && !try_attach(host)) {
        return;
    }

    auto value = m_process->read<uint32_t>(Address(LOAD_FLAG_ADDRESS));
    if (!value) {
        // Game may be mid-transition; look again next tick
        host.logger().debug("load flag unreadable");
        return;
    }

    m_last_value = *value;
    host.set_variable("load_flag", std::to_string(*value));

    TimerState state = host.state();
    if (state == TimerState::Paused && *value == GAMEPLAY_VALUE) {
        host.unpause();
    } else if (state == TimerState::Running && *value == LOADING_VALUE) {
        host.pause();
    }
}

} // namespace game_splitter
