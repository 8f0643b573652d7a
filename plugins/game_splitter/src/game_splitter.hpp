#pragma once

#include "autosplit_sdk/address.hpp"
#include "autosplit_sdk/host_functions.hpp"
#include "autosplit_sdk/process.hpp"

#include <cstdint>
#include <optional>

namespace game_splitter {

// Game.exe autosplitter
// Watches the game's load flag: 314 means gameplay, 42 means a loading
// screen. Game time is paused while loading and resumed once gameplay
// comes back.
class GameSplitter {
public:
    static constexpr const char* PROCESS_NAME = "Game.exe";
    static constexpr uint64_t LOAD_FLAG_ADDRESS = 0xD1;
    static constexpr uint32_t GAMEPLAY_VALUE = 314;
    static constexpr uint32_t LOADING_VALUE = 42;
    static constexpr double TICK_RATE = 60.0;

    explicit GameSplitter(autosplit_sdk::HostFunctions& host);

    void update(autosplit_sdk::HostFunctions& host);

    bool is_attached() const { return m_process.has_value(); }
    std::optional<uint32_t> get_last_value() const { return m_last_value; }

private:
    bool try_attach(autosplit_sdk::HostFunctions& host);

    std::optional<autosplit_sdk::Process> m_process;
    std::optional<uint32_t> m_last_value;
};

} // namespace game_splitter
