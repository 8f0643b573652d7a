#pragma once

#include "autosplitter_loader.hpp"
#include "host_config.hpp"
#include "scenario_file.hpp"
#include "simulated_host.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace autosplit {

// Runner application - loads a config, a scenario and an autosplitter
// module, then drives the module's update entry point for a fixed number
// of ticks against the simulated host.
class Application {
public:
    Application();
    ~Application();

    // Disable copy
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Parse arguments and set up host, scenario and plugin.
    // Returns false on error; is_running() is false after --help.
    bool initialize(int argc, char* argv[]);

    // Tick loop
    void run();

    // Destroy the plugin and unload it
    void shutdown();

    bool is_running() const { return m_running; }

    SimulatedHost& get_host() { return *m_host; }
    AutosplitterLoader& get_loader() { return m_loader; }
    const HostConfiguration& get_config() const { return m_config; }

private:
    bool parse_command_line(int argc, char* argv[], std::string& config_path);
    void print_usage(const char* program_name) const;
    void print_summary() const;

    std::unique_ptr<SimulatedHost> m_host;
    AutosplitterLoader m_loader;
    HostConfiguration m_config;
    ScenarioFile m_scenario;

    bool m_running = false;
    bool m_help_requested = false;
    int64_t m_tick_override = -1;
};

} // namespace autosplit
